#pragma once

#include "core/types/TransferResult.hpp"
#include "infrastructure/concurrency/ParallelFor.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace migengine::infra {

/**
 * @brief Log output settings.
 */
struct LoggingConfig {
    std::string level{"info"};          ///< Console level: trace, debug, info, warn, error, off.
    bool fileEnabled{false};            ///< Also write a rotating log file.
    std::string fileName{"engine.log"}; ///< Log file name inside the config directory.
};

/**
 * @brief Network probe and connection pool settings.
 */
struct NetworkConfig {
    int concurrency{50};          ///< Default probes in flight.
    int timeoutMs{3000};          ///< Default dial timeout in milliseconds.
    int poolMaxConnections{16};   ///< Connection pool capacity.
    int poolTimeoutMs{30000};     ///< Connection pool stale timeout in milliseconds.
};

/**
 * @brief Engine configuration settings.
 *
 * Every section falls back to these defaults for keys missing from
 * config.json. Command line options override the loaded values.
 */
struct EngineConfig {
    LoggingConfig logging;

    int hashingConcurrency{defaultFileConcurrency()}; ///< Files hashed in parallel, 0 for unbounded.
    int copyConcurrency{defaultFileConcurrency()};    ///< Files copied in parallel, 0 for unbounded.
    size_t copyBufferSize{1024 * 1024};  ///< Copy chunk size in bytes.

    NetworkConfig network;
    core::TransferConfig transfer;

    int monitoringIntervalMs{5000}; ///< Default continuous monitoring interval.
    int asioThreads{4};             ///< I/O context worker threads.
};

/**
 * @brief Manages engine configuration persistence.
 *
 * Loads and saves config.json in the configuration directory. The
 * directory is created on construction, and a default file is written the
 * first time load() finds none.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk.
     * @return True if loaded (or defaults written) successfully. On a parse
     *         error the defaults are kept and false is returned.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    EngineConfig& config() { return config_; }
    const EngineConfig& config() const { return config_; }

    std::filesystem::path configPath() const { return configPath_; }
    std::filesystem::path configDir() const { return configDir_; }

    /**
     * @brief Returns the path of the rotating log file.
     */
    std::filesystem::path logPath() const;

    /**
     * @brief Returns $XDG_CONFIG_HOME/migration-engine, falling back to
     *        ~/.config/migration-engine and then ./.migration-engine.
     */
    static std::filesystem::path defaultConfigDir();

    static nlohmann::json toJson(const EngineConfig& config);
    static EngineConfig fromJson(const nlohmann::json& j);

private:
    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    EngineConfig config_;
};

} // namespace migengine::infra
