/**
 * @file ICompressor.hpp
 * @brief Interface for stream compression and tar archiving.
 */

#pragma once

#include "core/types/CompressionResult.hpp"

#include <filesystem>
#include <optional>

namespace migengine::core {

/**
 * @brief Interface for compressing files and directory trees.
 *
 * The method may be given explicitly. When omitted it is inferred from the
 * destination name on compression and from the source name on decompression.
 */
class ICompressor {
public:
    virtual ~ICompressor() = default;

    /**
     * @brief Compresses a file or directory.
     * @param source File or directory to compress.
     * @param destination Output file.
     * @param method Explicit method, or nullopt to infer from the destination suffix.
     * @return Sizes, ratio, method and file count.
     * @throws std::invalid_argument for an unknown or inapplicable method.
     * @throws std::runtime_error on I/O or encoder failure.
     */
    virtual CompressionResult compress(const std::filesystem::path& source,
                                       const std::filesystem::path& destination,
                                       std::optional<CompressionMethod> method = std::nullopt) = 0;

    /**
     * @brief Decompresses a stream or extracts an archive.
     * @param source Compressed file or archive.
     * @param destination Output file (streams) or directory (archives).
     * @param method Explicit method, or nullopt to infer from the source suffix.
     * @return Sizes, ratio, method and file count.
     * @throws std::invalid_argument for an unknown method.
     * @throws std::runtime_error on I/O failure or a corrupt stream.
     */
    virtual CompressionResult decompress(const std::filesystem::path& source,
                                         const std::filesystem::path& destination,
                                         std::optional<CompressionMethod> method = std::nullopt) = 0;
};

} // namespace migengine::core
