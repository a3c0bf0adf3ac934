#include "app/Application.hpp"

#include "app/JsonSerializer.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

#ifndef MIGENGINE_VERSION
#define MIGENGINE_VERSION "0.0.0"
#endif

namespace migengine::app {

namespace {

spdlog::level::level_enum parseLevel(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("Unknown log level '{}', using info", name);
        return spdlog::level::info;
    }
    return level;
}

void require(const std::string& value, const char* option) {
    if (value.empty()) {
        throw std::invalid_argument(std::string("missing required option --") + option);
    }
}

template <typename T>
void requireList(const std::vector<T>& values, const char* option) {
    if (values.empty()) {
        throw std::invalid_argument(std::string("missing required option --") + option);
    }
}

} // namespace

Application::Application(CommandLineOptions options) : options_(std::move(options)) {
    // stderr only until the configuration is known
    initializeLogging(infra::LoggingConfig{});

    auto configDir = options_.configDir.value_or(infra::ConfigManager::defaultConfigDir());
    config_ = std::make_unique<infra::ConfigManager>(configDir);
    config_->load();

    auto& cfg = config_->config();
    if (options_.logLevel) {
        cfg.logging.level = *options_.logLevel;
    }
    initializeLogging(cfg.logging);
    initializeComponents();
}

Application::~Application() {
    spdlog::debug("Application shutting down...");

    if (resourceMonitor_) {
        resourceMonitor_->stopAllMonitoring();
    }
    if (asioContext_) {
        asioContext_->stop();
    }
    spdlog::default_logger()->flush();
}

void Application::initializeLogging(const infra::LoggingConfig& logging) {
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(parseLevel(logging.level));

    std::vector<spdlog::sink_ptr> sinks{consoleSink};

    if (logging.fileEnabled && config_) {
        auto logPath = config_->logPath();
        try {
            std::filesystem::create_directories(logPath.parent_path());
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logPath.string(), 5 * 1024 * 1024, 3);
            fileSink->set_level(spdlog::level::debug);
            sinks.push_back(fileSink);
        } catch (const std::exception& e) {
            spdlog::warn("Cannot open log file {}: {}", logPath.string(), e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("migengine", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    if (config_) {
        spdlog::debug("Migration engine {} starting, config {}", MIGENGINE_VERSION,
                      config_->configPath().string());
    }
}

void Application::initializeComponents() {
    const auto& cfg = config_->config();

    // Asio context
    asioContext_ = std::make_unique<infra::AsioContext>(
        static_cast<size_t>(std::max(1, cfg.asioThreads)));
    asioContext_->start();

    metrics_ = std::make_unique<infra::MetricsAggregator>();

    // File operations
    checksumService_ = std::make_unique<infra::ChecksumService>(cfg.copyBufferSize);
    fileCopier_ = std::make_unique<infra::FileCopier>(cfg.copyBufferSize);
    compressor_ = std::make_unique<infra::Compressor>();

    // Network
    networkProber_ = std::make_unique<infra::NetworkProber>(*asioContext_);
    transferService_ = std::make_unique<infra::TransferService>(cfg.transfer, *fileCopier_);

    // Monitoring
    resourceMonitor_ = std::make_unique<infra::ResourceMonitor>(*asioContext_);

    spdlog::debug("All components initialized");
}

int Application::run() {
    auto envelope = execute();
    std::cout << envelope.dump(2) << std::endl;
    return envelope.value("success", false) ? 0 : 1;
}

nlohmann::json Application::execute() {
    nlohmann::json envelope;

    auto start = std::chrono::steady_clock::now();
    bool ok = false;
    try {
        envelope["success"] = true;
        envelope["data"] = dispatch();
        ok = true;
    } catch (const std::exception& e) {
        spdlog::error("Operation '{}' failed: {}", options_.operation, e.what());
        envelope = {{"success", false}, {"error", e.what()}};
    }
    metrics_->recordOperation(options_.operation, std::chrono::steady_clock::now() - start, ok);

    if (options_.includeMetrics) {
        envelope["metrics"] = toJson(metrics_->summary());
    }
    return envelope;
}

nlohmann::json Application::dispatch() {
    const auto& op = options_.operation;
    spdlog::info("Running operation '{}'", op);

    if (op == "copy") {
        return runCopy();
    }
    if (op == "checksum") {
        return runChecksum();
    }
    if (op == "verify") {
        return runVerify();
    }
    if (op == "compress") {
        return runCompress();
    }
    if (op == "decompress") {
        return runDecompress();
    }
    if (op == "ping") {
        return runPing();
    }
    if (op == "portscan") {
        return runPortScan();
    }
    if (op == "dns") {
        return runDns();
    }
    if (op == "transfer") {
        return runTransfer();
    }
    if (op == "monitor") {
        return runMonitor();
    }
    if (op == "version") {
        return runVersion();
    }
    throw std::invalid_argument("unknown operation: " + op);
}

nlohmann::json Application::runCopy() {
    require(options_.source, "source");
    require(options_.destination, "destination");

    std::filesystem::path source(options_.source);
    core::CopyResult result;
    int64_t files = 1;
    if (std::filesystem::is_directory(source)) {
        files = 0;
        for (const auto& entry : std::filesystem::recursive_directory_iterator(source)) {
            files += entry.is_regular_file() ? 1 : 0;
        }
        int concurrency = options_.concurrency.value_or(config_->config().copyConcurrency);
        result = fileCopier_->copyDirectory(source, options_.destination, concurrency);
    } else {
        result = fileCopier_->copyFile(source, options_.destination);
    }

    metrics_->updateTransferStats(result.bytesCopied, result.bytesCopied, files, files);
    return toJson(result);
}

nlohmann::json Application::runChecksum() {
    int concurrency = options_.concurrency.value_or(config_->config().hashingConcurrency);

    if (!options_.directory.empty()) {
        if (!options_.files.empty()) {
            throw std::invalid_argument("--files and --directory are mutually exclusive");
        }
        return toJson(checksumService_->calculateDirectoryChecksum(options_.directory, concurrency));
    }

    requireList(options_.files, "files");
    return toJson(checksumService_->calculateChecksums(options_.files, concurrency));
}

nlohmann::json Application::runVerify() {
    require(options_.file, "file");
    require(options_.expected, "expected");
    require(options_.algorithm, "algorithm");

    bool valid =
        checksumService_->verifyChecksum(options_.file, options_.expected, options_.algorithm);
    return {{"file", options_.file},
            {"algorithm", options_.algorithm},
            {"expected", options_.expected},
            {"valid", valid}};
}

nlohmann::json Application::runCompress() {
    require(options_.source, "source");
    require(options_.destination, "destination");

    std::optional<core::CompressionMethod> method;
    if (!options_.method.empty()) {
        method = core::compressionMethodFromString(options_.method);
    }
    return toJson(compressor_->compress(options_.source, options_.destination, method));
}

nlohmann::json Application::runDecompress() {
    require(options_.source, "source");
    require(options_.destination, "destination");

    std::optional<core::CompressionMethod> method;
    if (!options_.method.empty()) {
        method = core::compressionMethodFromString(options_.method);
    }
    return toJson(compressor_->decompress(options_.source, options_.destination, method));
}

nlohmann::json Application::runPing() {
    requireList(options_.hosts, "hosts");

    const auto& network = config_->config().network;
    auto timeout = std::chrono::milliseconds(options_.timeoutMs.value_or(network.timeoutMs));
    int concurrency = options_.concurrency.value_or(network.concurrency);
    return toJson(networkProber_->ping(options_.hosts, timeout, concurrency));
}

nlohmann::json Application::runPortScan() {
    require(options_.host, "host");
    requireList(options_.ports, "ports");

    const auto& network = config_->config().network;
    auto ports = core::parsePortList(options_.ports);
    auto timeout = std::chrono::milliseconds(options_.timeoutMs.value_or(network.timeoutMs));
    int concurrency = options_.concurrency.value_or(network.concurrency);
    return toJson(networkProber_->scanPorts(options_.host, ports, timeout, concurrency));
}

nlohmann::json Application::runDns() {
    requireList(options_.domains, "domains");

    int concurrency = options_.concurrency.value_or(config_->config().network.concurrency);
    return toJson(networkProber_->lookupDns(options_.domains, concurrency));
}

nlohmann::json Application::runTransfer() {
    require(options_.source, "source");
    require(options_.destination, "destination");
    require(options_.method, "method");

    auto result = transferService_->transfer(options_.source, options_.destination, options_.method);
    metrics_->updateTransferStats(result.bytesTransferred, result.bytesTransferred,
                                  result.success ? 1 : 0, 1);
    if (!result.success) {
        metrics_->recordTransferError();
    }
    return toJson(result);
}

nlohmann::json Application::runMonitor() {
    int count = options_.count.value_or(1);
    if (count < 1) {
        throw std::invalid_argument("--count must be at least 1");
    }

    if (count == 1) {
        auto stats = resourceMonitor_->getSystemStats();
        metrics_->updateSystemStats(stats);
        return toJson(stats);
    }

    auto interval = std::chrono::milliseconds(
        options_.intervalMs.value_or(config_->config().monitoringIntervalMs));

    // Shared with the sampling callback, which may still be running after stopMonitoring()
    struct Collected {
        std::mutex mutex;
        std::condition_variable done;
        std::vector<core::SystemStats> samples;
    };
    auto collected = std::make_shared<Collected>();

    auto id = resourceMonitor_->startMonitoring(
        interval, [collected, count, metrics = metrics_.get()](const core::SystemStats& stats) {
            metrics->updateSystemStats(stats);
            std::lock_guard lock(collected->mutex);
            if (static_cast<int>(collected->samples.size()) < count) {
                collected->samples.push_back(stats);
            }
            if (static_cast<int>(collected->samples.size()) >= count) {
                collected->done.notify_all();
            }
        });

    {
        std::unique_lock lock(collected->mutex);
        collected->done.wait(lock, [&] {
            return static_cast<int>(collected->samples.size()) >= count;
        });
    }
    resourceMonitor_->stopMonitoring(id);

    std::lock_guard lock(collected->mutex);
    nlohmann::json data = nlohmann::json::array();
    for (const auto& stats : collected->samples) {
        data.push_back(toJson(stats));
    }
    return data;
}

nlohmann::json Application::runVersion() const {
#ifdef NDEBUG
    const char* buildType = "release";
#else
    const char* buildType = "debug";
#endif
    return {{"name", "migration-engine"},
            {"version", MIGENGINE_VERSION},
            {"build", buildType},
            {"cxx_standard", static_cast<long>(__cplusplus)},
            {"asio_threads", asioContext_->threadCount()}};
}

} // namespace migengine::app
