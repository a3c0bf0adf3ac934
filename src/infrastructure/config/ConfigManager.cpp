#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace migengine::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, writing defaults to {}", configPath_.string());
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        config_ = fromJson(j);

        spdlog::debug("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config {}: {}", configPath_.string(), e.what());
        config_ = EngineConfig{};
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson(config_);

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

std::filesystem::path ConfigManager::logPath() const {
    return configDir_ / config_.logging.fileName;
}

std::filesystem::path ConfigManager::defaultConfigDir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
        return std::filesystem::path(xdg) / "migration-engine";
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return std::filesystem::path(home) / ".config" / "migration-engine";
    }
    return std::filesystem::current_path() / ".migration-engine";
}

nlohmann::json ConfigManager::toJson(const EngineConfig& config) {
    nlohmann::json j;

    // Logging
    j["logging"]["level"] = config.logging.level;
    j["logging"]["file_enabled"] = config.logging.fileEnabled;
    j["logging"]["file_name"] = config.logging.fileName;

    // File operations
    j["hashing"]["concurrency"] = config.hashingConcurrency;
    j["copy"]["concurrency"] = config.copyConcurrency;
    j["copy"]["buffer_size"] = config.copyBufferSize;

    // Network
    j["network"]["concurrency"] = config.network.concurrency;
    j["network"]["timeout_ms"] = config.network.timeoutMs;
    j["network"]["pool_max_connections"] = config.network.poolMaxConnections;
    j["network"]["pool_timeout_ms"] = config.network.poolTimeoutMs;

    // Transfer
    j["transfer"]["chunk_size"] = config.transfer.chunkSize;
    j["transfer"]["max_concurrency"] = config.transfer.maxConcurrency;
    j["transfer"]["timeout_ms"] = config.transfer.timeout.count();
    j["transfer"]["retry_attempts"] = config.transfer.retryAttempts;
    j["transfer"]["retry_delay_ms"] = config.transfer.retryDelay.count();

    j["monitoring"]["interval_ms"] = config.monitoringIntervalMs;
    j["asio"]["threads"] = config.asioThreads;

    return j;
}

EngineConfig ConfigManager::fromJson(const nlohmann::json& j) {
    EngineConfig config;

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config.logging.level = l.value("level", config.logging.level);
        config.logging.fileEnabled = l.value("file_enabled", config.logging.fileEnabled);
        config.logging.fileName = l.value("file_name", config.logging.fileName);
    }

    if (j.contains("hashing")) {
        config.hashingConcurrency = j["hashing"].value("concurrency", config.hashingConcurrency);
    }

    if (j.contains("copy")) {
        const auto& c = j["copy"];
        config.copyConcurrency = c.value("concurrency", config.copyConcurrency);
        config.copyBufferSize = c.value("buffer_size", config.copyBufferSize);
    }

    if (j.contains("network")) {
        const auto& n = j["network"];
        config.network.concurrency = n.value("concurrency", config.network.concurrency);
        config.network.timeoutMs = n.value("timeout_ms", config.network.timeoutMs);
        config.network.poolMaxConnections =
            n.value("pool_max_connections", config.network.poolMaxConnections);
        config.network.poolTimeoutMs = n.value("pool_timeout_ms", config.network.poolTimeoutMs);
    }

    if (j.contains("transfer")) {
        const auto& t = j["transfer"];
        config.transfer.chunkSize = t.value("chunk_size", config.transfer.chunkSize);
        config.transfer.maxConcurrency = t.value("max_concurrency", config.transfer.maxConcurrency);
        config.transfer.timeout =
            std::chrono::milliseconds(t.value("timeout_ms", config.transfer.timeout.count()));
        config.transfer.retryAttempts = t.value("retry_attempts", config.transfer.retryAttempts);
        config.transfer.retryDelay =
            std::chrono::milliseconds(t.value("retry_delay_ms", config.transfer.retryDelay.count()));
    }

    if (j.contains("monitoring")) {
        config.monitoringIntervalMs = j["monitoring"].value("interval_ms", config.monitoringIntervalMs);
    }

    if (j.contains("asio")) {
        config.asioThreads = j["asio"].value("threads", config.asioThreads);
    }

    return config;
}

} // namespace migengine::infra
