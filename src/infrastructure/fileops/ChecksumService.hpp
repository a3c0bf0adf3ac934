#pragma once

#include "core/services/IChecksumService.hpp"

#include <cstddef>

namespace migengine::infra {

/**
 * @brief Parallel multi-algorithm file hasher.
 *
 * Each file is read exactly once; MD5, SHA-1 and SHA-256 are computed from
 * the same stream. Files are hashed concurrently, one task per file unless a
 * concurrency limit is given. Implements the core::IChecksumService interface.
 */
class ChecksumService : public core::IChecksumService {
public:
    /**
     * @brief Constructs a ChecksumService.
     * @param bufferSize Read buffer size per file in bytes.
     */
    explicit ChecksumService(size_t bufferSize = 1024 * 1024);

    core::ChecksumBatch calculateChecksums(const std::vector<std::string>& files,
                                           int concurrency = 0) override;

    core::ChecksumBatch calculateDirectoryChecksum(const std::filesystem::path& root,
                                                   int concurrency = 0) override;

    bool verifyChecksum(const std::filesystem::path& file, const std::string& expected,
                        const std::string& algorithm) override;

    /**
     * @brief Hashes a single file with all three algorithms.
     *
     * Never throws for I/O problems: failures are reported in the error field.
     *
     * @param file File to hash.
     * @return Digests and size, or an error.
     */
    core::ChecksumResult hashFile(const std::string& file) const;

private:
    size_t bufferSize_;
};

} // namespace migengine::infra
