/**
 * @file ChecksumResult.hpp
 * @brief Digest algorithms and checksum result types.
 *
 * This file defines the supported digest algorithms and the per-file and
 * batch results produced by the checksum service.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace migengine::core {

/**
 * @brief Digest algorithms supported by the checksum service.
 */
enum class HashAlgorithm : int {
    MD5 = 0,   ///< 128-bit digest, 32 hex characters
    SHA1 = 1,  ///< 160-bit digest, 40 hex characters
    SHA256 = 2 ///< 256-bit digest, 64 hex characters
};

/**
 * @brief Converts a HashAlgorithm to its lowercase name ("md5", "sha1", "sha256").
 * @param algorithm The algorithm to convert.
 * @return Lowercase algorithm name.
 */
std::string hashAlgorithmToString(HashAlgorithm algorithm);

/**
 * @brief Parses an algorithm name (case-insensitive).
 * @param name Algorithm name such as "md5", "SHA1" or "sha-256".
 * @return The corresponding HashAlgorithm.
 * @throws std::invalid_argument if the name is not a supported algorithm.
 */
HashAlgorithm hashAlgorithmFromString(const std::string& name);

/**
 * @brief Number of hex characters in a digest produced by the algorithm.
 */
[[nodiscard]] constexpr size_t hexDigestLength(HashAlgorithm algorithm) {
    switch (algorithm) {
    case HashAlgorithm::MD5:
        return 32;
    case HashAlgorithm::SHA1:
        return 40;
    case HashAlgorithm::SHA256:
        return 64;
    }
    return 0;
}

/**
 * @brief Digests of a single file.
 *
 * When the file cannot be read, error is populated and all digests are empty.
 * The size is captured by the initial stat and survives a later read failure.
 */
struct ChecksumResult {
    std::string file;   ///< Path of the hashed file
    std::string md5;    ///< Lowercase hex MD5 digest
    std::string sha1;   ///< Lowercase hex SHA-1 digest
    std::string sha256; ///< Lowercase hex SHA-256 digest
    int64_t size{0};    ///< File size in bytes
    std::string error;  ///< Error message if the file could not be hashed

    /**
     * @brief Checks whether the file was hashed successfully.
     * @return True if no error was recorded.
     */
    [[nodiscard]] bool ok() const { return error.empty(); }

    /**
     * @brief Returns the digest for the given algorithm.
     * @param algorithm Algorithm whose digest to return.
     * @return Reference to the stored hex digest.
     */
    [[nodiscard]] const std::string& digest(HashAlgorithm algorithm) const;

    bool operator==(const ChecksumResult& other) const = default;
};

/**
 * @brief Ordered checksum results, one per input path.
 *
 * success is always true: individual failures are reported through the
 * per-file error fields only.
 */
struct ChecksumBatch {
    std::vector<ChecksumResult> results; ///< Results in input order
    bool success{true};                  ///< Batch-level success flag

    /**
     * @brief Counts the results that carry an error.
     * @return Number of failed files.
     */
    [[nodiscard]] size_t failureCount() const;
};

} // namespace migengine::core
