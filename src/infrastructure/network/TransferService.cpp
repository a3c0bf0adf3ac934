#include "infrastructure/network/TransferService.hpp"

#include "core/types/CopyResult.hpp"
#include "infrastructure/concurrency/WorkerPool.hpp"
#include "infrastructure/fileops/FileHandle.hpp"
#include "infrastructure/network/HttpClient.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace migengine::infra {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::microseconds elapsedSince(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
}

void createParentDirectories(const std::filesystem::path& path) {
    auto parent = path.parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw std::runtime_error("failed to create destination directory: " + ec.message());
    }
}

core::TransferResult finished(const std::string& method, int64_t bytes, Clock::time_point start) {
    core::TransferResult result;
    result.method = method;
    result.bytesTransferred = bytes;
    result.duration = elapsedSince(start);
    result.transferRateMBps = core::transferRateMBps(bytes, result.duration);
    result.success = true;
    return result;
}

core::TransferResult failed(const std::string& method, const std::string& error,
                            Clock::time_point start) {
    core::TransferResult result;
    result.method = method;
    result.duration = elapsedSince(start);
    result.success = false;
    result.error = error;
    return result;
}

/**
 * @brief Runs attempt() until it succeeds or the retry budget is spent.
 *
 * attempt() returns an empty string on success or the failure text.
 * std::runtime_error thrown by attempt() counts as a failed attempt;
 * std::invalid_argument is not retried.
 *
 * @return Empty on success, otherwise the last failure text.
 */
template <typename Attempt>
std::string withRetry(const core::TransferConfig& config, const std::string& what,
                      Attempt&& attempt) {
    std::string lastError;
    for (int i = 0; i <= config.retryAttempts; ++i) {
        if (i > 0) {
            auto delay = config.retryDelay * i;
            spdlog::warn("{} failed ({}), retrying in {} ms ({}/{})", what, lastError,
                         delay.count(), i, config.retryAttempts);
            std::this_thread::sleep_for(delay);
        }

        try {
            lastError = attempt();
        } catch (const std::invalid_argument&) {
            throw;
        } catch (const std::runtime_error& e) {
            lastError = e.what();
        }

        if (lastError.empty()) {
            return {};
        }
    }
    return lastError;
}

} // namespace

TransferService::TransferService(core::TransferConfig config, core::IFileCopier& copier)
    : config_(config), copier_(copier) {
    config_.chunkSize = config_.chunkSize > 0 ? config_.chunkSize : 1024 * 1024;
    config_.maxConcurrency = std::max(config_.maxConcurrency, 1);
    config_.retryAttempts = std::max(config_.retryAttempts, 0);
}

core::TransferResult TransferService::transfer(const std::string& source,
                                               const std::string& destination,
                                               const std::string& method) {
    std::string normalized = method;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (normalized == "http") {
        return download(source, destination);
    }

    auto start = Clock::now();
    if (normalized != "chunked" && normalized != "concurrent") {
        throw std::invalid_argument("unsupported transfer method: " + method);
    }

    try {
        int64_t bytes = normalized == "chunked" ? chunkedCopy(source, destination, nullptr)
                                                : concurrentCopy(source, destination);
        auto result = finished(normalized, bytes, start);
        spdlog::info("Transfer {} -> {} ({}) complete: {} bytes, {:.2f} MB/s", source,
                     destination, normalized, bytes, result.transferRateMBps);
        return result;
    } catch (const std::runtime_error& e) {
        spdlog::error("Transfer {} -> {} ({}) failed: {}", source, destination, normalized,
                      e.what());
        return failed(normalized, e.what(), start);
    }
}

core::TransferResult TransferService::download(const std::string& url,
                                               const std::filesystem::path& destination) {
    auto start = Clock::now();
    HttpClient client(config_.timeout, config_.chunkSize);
    int64_t bytes = 0;

    try {
        createParentDirectories(destination);

        auto error = withRetry(config_, "Download of " + url, [&]() -> std::string {
            // Each attempt starts from an empty file
            auto output = FileHandle::create(destination);
            auto response = client.get(url, [&output](const char* data, size_t size) {
                output.writeAll(data, size);
            });
            if (response.status != 200) {
                return "HTTP error: " + response.statusLine();
            }
            output.sync();
            output.close();
            bytes = response.bodyBytes;
            return {};
        });

        if (!error.empty()) {
            spdlog::error("Download of {} failed: {}", url, error);
            return failed("http", error, start);
        }
    } catch (const std::exception& e) {
        spdlog::error("Download of {} failed: {}", url, e.what());
        return failed("http", e.what(), start);
    }

    auto result = finished("http", bytes, start);
    spdlog::info("Downloaded {} -> {} ({} bytes, {:.2f} MB/s)", url, destination.string(), bytes,
                 result.transferRateMBps);
    return result;
}

core::TransferResult TransferService::upload(const std::filesystem::path& source,
                                             const std::string& url) {
    auto start = Clock::now();
    HttpClient client(config_.timeout, config_.chunkSize);
    int64_t bytes = 0;

    try {
        bytes = FileHandle::openForRead(source).size();

        auto error = withRetry(config_, "Upload to " + url, [&]() -> std::string {
            auto response = client.put(url, source);
            if (!response.isSuccess()) {
                return "HTTP error: " + response.statusLine();
            }
            return {};
        });

        if (!error.empty()) {
            spdlog::error("Upload of {} failed: {}", source.string(), error);
            return failed("upload", error, start);
        }
    } catch (const std::exception& e) {
        spdlog::error("Upload of {} failed: {}", source.string(), e.what());
        return failed("upload", e.what(), start);
    }

    auto result = finished("upload", bytes, start);
    spdlog::info("Uploaded {} -> {} ({} bytes)", source.string(), url, bytes);
    return result;
}

std::vector<core::TransferResult> TransferService::concurrentDownload(
    const std::vector<std::string>& urls, const std::filesystem::path& destinationDir) {
    std::vector<core::TransferResult> results(urls.size());

    spdlog::info("Downloading {} URLs into {} (concurrency {})", urls.size(),
                 destinationDir.string(), config_.maxConcurrency);

    WorkerPool pool(static_cast<size_t>(std::max(1, config_.maxConcurrency)));
    pool.start();
    for (size_t index = 0; index < urls.size(); ++index) {
        pool.submit([this, &urls, &results, &destinationDir, index] {
            std::string filename;
            try {
                filename = HttpUrl::parse(urls[index]).lastPathSegment();
            } catch (const std::invalid_argument& e) {
                results[index] = failed("http", e.what(), Clock::now());
                return;
            }
            if (filename.empty()) {
                filename = "download_" + std::to_string(index);
            }
            results[index] = download(urls[index], destinationDir / filename);
        });
    }
    pool.stop();

    auto succeeded = std::count_if(results.begin(), results.end(),
                                   [](const core::TransferResult& r) { return r.success; });
    spdlog::info("Concurrent download complete: {}/{} succeeded", succeeded, urls.size());
    return results;
}

core::TransferResult TransferService::transferWithProgress(
    const std::filesystem::path& source, const std::filesystem::path& destination,
    core::TransferProgressCallback callback) {
    auto start = Clock::now();
    try {
        int64_t bytes = chunkedCopy(source, destination, callback);
        return finished("progress", bytes, start);
    } catch (const std::runtime_error& e) {
        spdlog::error("Transfer {} -> {} failed: {}", source.string(), destination.string(),
                      e.what());
        return failed("progress", e.what(), start);
    }
}

int64_t TransferService::chunkedCopy(const std::filesystem::path& source,
                                     const std::filesystem::path& destination,
                                     const core::TransferProgressCallback& callback) const {
    auto input = FileHandle::openForRead(source);
    int64_t total = input.size();

    createParentDirectories(destination);
    auto output = FileHandle::create(destination);

    std::vector<char> buffer(config_.chunkSize);
    int64_t transferred = 0;
    while (true) {
        size_t n = input.read(buffer.data(), buffer.size());
        if (n == 0) {
            break;
        }
        output.writeAll(buffer.data(), n);
        transferred += static_cast<int64_t>(n);
        if (callback) {
            callback(transferred, total);
        }
    }

    output.close();
    return transferred;
}

int64_t TransferService::concurrentCopy(const std::filesystem::path& source,
                                        const std::filesystem::path& destination) {
    std::error_code ec;
    auto status = std::filesystem::status(source, ec);
    if (ec || !std::filesystem::exists(status)) {
        throw std::runtime_error("failed to stat source: " +
                                 (ec ? ec.message() : std::string("no such file or directory")));
    }

    if (std::filesystem::is_directory(status)) {
        return copier_.copyDirectory(source, destination, config_.maxConcurrency).bytesCopied;
    }
    return copier_.copyFile(source, destination).bytesCopied;
}

} // namespace migengine::infra
