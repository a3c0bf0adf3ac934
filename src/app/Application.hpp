#pragma once

#include "app/CommandLine.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/fileops/ChecksumService.hpp"
#include "infrastructure/fileops/Compressor.hpp"
#include "infrastructure/fileops/FileCopier.hpp"
#include "infrastructure/monitoring/MetricsAggregator.hpp"
#include "infrastructure/monitoring/ResourceMonitor.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/NetworkProber.hpp"
#include "infrastructure/network/TransferService.hpp"

#include <memory>
#include <nlohmann/json.hpp>

namespace migengine::app {

/**
 * @brief Wires the engine components together and runs one CLI operation.
 *
 * Construction configures logging, loads the configuration and creates
 * every component. run() executes the requested operation and prints a
 * single JSON envelope {"success", "data" | "error"} to stdout.
 */
class Application {
public:
    explicit Application(CommandLineOptions options);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Executes the operation and prints the envelope.
     * @return Process exit code: 0 on success, 1 on error.
     */
    int run();

    /**
     * @brief Executes the operation and builds the envelope without printing it.
     */
    nlohmann::json execute();

    infra::ConfigManager& config() { return *config_; }
    infra::AsioContext& asioContext() { return *asioContext_; }
    infra::MetricsAggregator& metrics() { return *metrics_; }

private:
    void initializeLogging(const infra::LoggingConfig& logging);
    void initializeComponents();

    nlohmann::json dispatch();
    nlohmann::json runCopy();
    nlohmann::json runChecksum();
    nlohmann::json runVerify();
    nlohmann::json runCompress();
    nlohmann::json runDecompress();
    nlohmann::json runPing();
    nlohmann::json runPortScan();
    nlohmann::json runDns();
    nlohmann::json runTransfer();
    nlohmann::json runMonitor();
    nlohmann::json runVersion() const;

    CommandLineOptions options_;
    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<infra::AsioContext> asioContext_;
    std::unique_ptr<infra::MetricsAggregator> metrics_;
    std::unique_ptr<infra::ChecksumService> checksumService_;
    std::unique_ptr<infra::FileCopier> fileCopier_;
    std::unique_ptr<infra::Compressor> compressor_;
    std::unique_ptr<infra::NetworkProber> networkProber_;
    std::unique_ptr<infra::TransferService> transferService_;
    std::unique_ptr<infra::ResourceMonitor> resourceMonitor_;
};

} // namespace migengine::app
