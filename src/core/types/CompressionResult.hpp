/**
 * @file CompressionResult.hpp
 * @brief Compression methods and the result of compress/decompress calls.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace migengine::core {

/**
 * @brief Stream and archive formats understood by the compressor.
 */
enum class CompressionMethod : int {
    Gzip = 0,    ///< Single-file gzip stream
    Zstd = 1,    ///< Single-file zstd stream
    Tar = 2,     ///< Uncompressed tar archive
    TarGzip = 3, ///< gzip-compressed tar archive
    TarZstd = 4  ///< zstd-compressed tar archive
};

/**
 * @brief Converts a CompressionMethod to its canonical name.
 * @param method The method to convert.
 * @return "gzip", "zstd", "tar", "tar.gz" or "tar.zst".
 */
std::string compressionMethodToString(CompressionMethod method);

/**
 * @brief Parses a method name such as "gzip", "zst", "tar.gz" or "tgz".
 * @param name Method name (case-insensitive).
 * @return The corresponding CompressionMethod.
 * @throws std::invalid_argument if the name is not recognised.
 */
CompressionMethod compressionMethodFromString(const std::string& name);

/**
 * @brief Infers the method from a file name suffix.
 *
 * Recognises .tar.gz/.tgz, .tar.zst/.tar.zstd, .tar, .gz/.gzip and
 * .zst/.zstd, case-insensitively.
 *
 * @param path File name to inspect.
 * @return The inferred method.
 * @throws std::invalid_argument if the suffix is not recognised.
 */
CompressionMethod compressionMethodFromPath(const std::filesystem::path& path);

/**
 * @brief Checks whether a method produces a tar archive.
 */
[[nodiscard]] constexpr bool isArchiveMethod(CompressionMethod method) {
    return method == CompressionMethod::Tar || method == CompressionMethod::TarGzip ||
           method == CompressionMethod::TarZstd;
}

/**
 * @brief Outcome of a compression or decompression call.
 *
 * compressionRatio is always compressedSize / originalSize. It is not bounded
 * by 1: incompressible input yields a ratio above 1.
 */
struct CompressionResult {
    int64_t originalSize{0};               ///< Uncompressed byte total
    int64_t compressedSize{0};             ///< Size of the compressed file on disk
    double compressionRatio{0.0};          ///< compressedSize / originalSize (0 if original is 0)
    std::chrono::microseconds duration{0}; ///< Wall-clock duration
    CompressionMethod method{CompressionMethod::Gzip}; ///< Method used
    int64_t fileCount{0};                  ///< Regular files compressed or extracted
    bool success{false};                   ///< Whether the operation completed

    /**
     * @brief Returns the method name.
     * @return Canonical method name.
     */
    [[nodiscard]] std::string methodName() const { return compressionMethodToString(method); }

    /**
     * @brief Converts the duration to milliseconds.
     */
    [[nodiscard]] double durationMs() const {
        return static_cast<double>(duration.count()) / 1000.0;
    }

    /**
     * @brief Computes compressed / original, returning 0 for empty input.
     * @param compressed Compressed size in bytes.
     * @param original Original size in bytes.
     * @return Non-negative ratio.
     */
    static double ratio(int64_t compressed, int64_t original);
};

} // namespace migengine::core
