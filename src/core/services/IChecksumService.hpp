/**
 * @file IChecksumService.hpp
 * @brief Interface for multi-algorithm file hashing.
 */

#pragma once

#include "core/types/ChecksumResult.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace migengine::core {

/**
 * @brief Interface for computing and verifying file digests.
 */
class IChecksumService {
public:
    virtual ~IChecksumService() = default;

    /**
     * @brief Hashes files in parallel with MD5, SHA-1 and SHA-256.
     * @param files Paths to hash.
     * @param concurrency Maximum files hashed at once, 0 for one task per file.
     * @return One result per input path, in input order.
     */
    virtual ChecksumBatch calculateChecksums(const std::vector<std::string>& files,
                                             int concurrency = 0) = 0;

    /**
     * @brief Hashes every regular file below a directory.
     * @param root Directory to walk recursively.
     * @param concurrency Maximum files hashed at once, 0 for one task per file.
     * @return One result per regular file, ordered by path.
     * @throws std::runtime_error if the directory cannot be walked.
     */
    virtual ChecksumBatch calculateDirectoryChecksum(const std::filesystem::path& root,
                                                     int concurrency = 0) = 0;

    /**
     * @brief Recomputes one digest and compares it to an expected value.
     * @param file File to hash.
     * @param expected Expected hex digest (case-insensitive).
     * @param algorithm Algorithm name ("md5", "sha1" or "sha256").
     * @return True if the digests match.
     * @throws std::invalid_argument for an unsupported algorithm.
     * @throws std::runtime_error if the file cannot be read.
     */
    virtual bool verifyChecksum(const std::filesystem::path& file, const std::string& expected,
                                const std::string& algorithm) = 0;
};

} // namespace migengine::core
