#include "infrastructure/fileops/FileCopier.hpp"

#include "infrastructure/concurrency/ParallelFor.hpp"
#include "infrastructure/fileops/FileHandle.hpp"
#include "infrastructure/fileops/MultiDigest.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <vector>

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
        throw std::runtime_error("failed to create destination directory " + parent.string() +
                                 ": " + ec.message());
    }
}

} // namespace

FileCopier::FileCopier(size_t bufferSize) : bufferSize_(bufferSize > 0 ? bufferSize : 64 * 1024) {}

core::CopyResult FileCopier::copyFile(const std::filesystem::path& source,
                                      const std::filesystem::path& destination) {
    auto start = Clock::now();

    auto input = FileHandle::openForRead(source);

    std::error_code ec;
    auto permissions = std::filesystem::status(source, ec).permissions();
    if (ec) {
        throw std::runtime_error("failed to get source file info " + source.string() + ": " +
                                 ec.message());
    }

    createParentDirectories(destination);
    auto output = FileHandle::create(destination);

    Digest digest(core::HashAlgorithm::SHA256);
    std::vector<char> buffer(bufferSize_);
    int64_t bytesCopied = 0;

    while (true) {
        size_t n = input.read(buffer.data(), buffer.size());
        if (n == 0) {
            break;
        }
        output.writeAll(buffer.data(), n);
        digest.update(buffer.data(), n);
        bytesCopied += static_cast<int64_t>(n);
    }

    output.sync();
    output.close();

    std::filesystem::permissions(destination, permissions, std::filesystem::perm_options::replace,
                                 ec);
    if (ec) {
        throw std::runtime_error("failed to set file permissions on " + destination.string() +
                                 ": " + ec.message());
    }

    core::CopyResult result;
    result.bytesCopied = bytesCopied;
    result.duration = elapsedSince(start);
    result.checksum = digest.finalHex();
    result.transferRateMBps = core::transferRateMBps(bytesCopied, result.duration);
    result.success = true;

    spdlog::debug("Copied {} -> {} ({} bytes, {:.2f} MB/s)", source.string(), destination.string(),
                  bytesCopied, result.transferRateMBps);
    return result;
}

core::CopyResult FileCopier::copyDirectory(const std::filesystem::path& source,
                                           const std::filesystem::path& destination,
                                           int concurrency) {
    auto start = Clock::now();

    struct CopyJob {
        std::filesystem::path source;
        std::filesystem::path destination;
    };
    std::vector<CopyJob> jobs;

    // Mirror the directory structure serially before any file is copied
    try {
        if (!std::filesystem::is_directory(source)) {
            throw std::runtime_error("source is not a directory: " + source.string());
        }

        std::filesystem::create_directories(destination);
        std::filesystem::permissions(destination, std::filesystem::status(source).permissions(),
                                     std::filesystem::perm_options::replace);

        for (const auto& entry : std::filesystem::recursive_directory_iterator(source)) {
            auto target = destination / std::filesystem::relative(entry.path(), source);

            if (entry.is_directory()) {
                std::filesystem::create_directories(target);
                std::filesystem::permissions(target, entry.status().permissions(),
                                             std::filesystem::perm_options::replace);
            } else if (entry.is_regular_file()) {
                jobs.push_back({entry.path(), target});
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Failed to walk source directory {}: {}", source.string(), e.what());
        throw std::runtime_error("failed to walk source directory: " + std::string(e.what()));
    }

    spdlog::info("Copying {} files from {} to {}", jobs.size(), source.string(),
                 destination.string());

    std::atomic<int64_t> totalBytes{0};
    std::mutex errorMutex;
    std::string firstError;

    parallelFor(jobs.size(), concurrency, [&](size_t index) {
        try {
            auto result = copyFile(jobs[index].source, jobs[index].destination);
            totalBytes += result.bytesCopied;
        } catch (const std::exception& e) {
            spdlog::warn("Copy failed for {}: {}", jobs[index].source.string(), e.what());
            std::lock_guard lock(errorMutex);
            if (firstError.empty()) {
                firstError = e.what();
            }
        }
    });

    if (!firstError.empty()) {
        throw std::runtime_error(firstError);
    }

    core::CopyResult result;
    result.bytesCopied = totalBytes.load();
    result.duration = elapsedSince(start);
    result.transferRateMBps = core::transferRateMBps(result.bytesCopied, result.duration);
    result.success = true;

    spdlog::info("Directory copy complete: {} bytes in {:.1f} ms", result.bytesCopied,
                 result.durationMs());
    return result;
}

} // namespace migengine::infra
