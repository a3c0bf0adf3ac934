#include "infrastructure/fileops/ChecksumService.hpp"

#include "infrastructure/concurrency/ParallelFor.hpp"
#include "infrastructure/fileops/FileHandle.hpp"
#include "infrastructure/fileops/MultiDigest.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>

namespace migengine::infra {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

ChecksumService::ChecksumService(size_t bufferSize)
    : bufferSize_(bufferSize > 0 ? bufferSize : 64 * 1024) {}

core::ChecksumResult ChecksumService::hashFile(const std::string& file) const {
    core::ChecksumResult result;
    result.file = file;

    std::error_code ec;
    auto size = std::filesystem::file_size(file, ec);
    if (ec) {
        result.error = "failed to stat file: " + ec.message();
        spdlog::debug("Checksum skipped for {}: {}", file, result.error);
        return result;
    }
    result.size = static_cast<int64_t>(size);

    try {
        auto handle = FileHandle::openForRead(file);

        MultiDigest digest({core::HashAlgorithm::MD5, core::HashAlgorithm::SHA1,
                            core::HashAlgorithm::SHA256});
        std::vector<char> buffer(bufferSize_);

        while (true) {
            size_t n = handle.read(buffer.data(), buffer.size());
            if (n == 0) {
                break;
            }
            digest.update(buffer.data(), n);
        }

        auto hex = digest.finalHex();
        result.md5 = std::move(hex[0]);
        result.sha1 = std::move(hex[1]);
        result.sha256 = std::move(hex[2]);
    } catch (const std::exception& e) {
        result.md5.clear();
        result.sha1.clear();
        result.sha256.clear();
        result.error = e.what();
        spdlog::warn("Checksum failed for {}: {}", file, result.error);
    }

    return result;
}

core::ChecksumBatch ChecksumService::calculateChecksums(const std::vector<std::string>& files,
                                                        int concurrency) {
    spdlog::info("Calculating checksums for {} files (concurrency: {})", files.size(),
                 concurrency > 0 ? std::to_string(concurrency) : "unbounded");

    core::ChecksumBatch batch;
    batch.results.resize(files.size());

    // Each task writes only its own slot
    parallelFor(files.size(), concurrency,
                [this, &files, &batch](size_t index) { batch.results[index] = hashFile(files[index]); });

    batch.success = true;

    auto failures = batch.failureCount();
    if (failures > 0) {
        spdlog::warn("Checksum batch finished with {} of {} files failing", failures, files.size());
    } else {
        spdlog::debug("Checksum batch finished for {} files", files.size());
    }

    return batch;
}

core::ChecksumBatch ChecksumService::calculateDirectoryChecksum(const std::filesystem::path& root,
                                                               int concurrency) {
    std::vector<std::string> files;

    try {
        for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
            if (entry.is_regular_file()) {
                files.push_back(entry.path().string());
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Failed to walk {}: {}", root.string(), e.what());
        throw std::runtime_error("failed to walk directory: " + std::string(e.what()));
    }

    std::sort(files.begin(), files.end());
    return calculateChecksums(files, concurrency);
}

bool ChecksumService::verifyChecksum(const std::filesystem::path& file, const std::string& expected,
                                     const std::string& algorithm) {
    auto parsed = core::hashAlgorithmFromString(algorithm);

    auto handle = FileHandle::openForRead(file);
    Digest digest(parsed);
    std::vector<char> buffer(bufferSize_);

    while (true) {
        size_t n = handle.read(buffer.data(), buffer.size());
        if (n == 0) {
            break;
        }
        digest.update(buffer.data(), n);
    }

    auto actual = digest.finalHex();
    bool match = actual == toLower(expected);
    spdlog::debug("Verify {} ({}) -> {}", file.string(), core::hashAlgorithmToString(parsed),
                  match ? "match" : "mismatch");
    return match;
}

} // namespace migengine::infra
