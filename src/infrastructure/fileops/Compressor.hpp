#pragma once

#include "core/services/ICompressor.hpp"

#include <cstddef>
#include <cstdint>

namespace migengine::infra {

/**
 * @brief Stream compressor and tar archiver.
 *
 * Single files are encoded as gzip (zlib) or zstd (libzstd) streams. Files
 * and directory trees are archived as tar, tar.gz or tar.zst through
 * libarchive. File content is always streamed in fixed-size chunks, never
 * loaded whole. Implements the core::ICompressor interface.
 */
class Compressor : public core::ICompressor {
public:
    /**
     * @brief Compression tuning.
     */
    struct Options {
        size_t chunkSize{256 * 1024}; ///< Read buffer size in bytes
        int gzipLevel{6};             ///< zlib level 1-9
        int zstdLevel{3};             ///< zstd level 1-19
    };

    Compressor();
    explicit Compressor(Options options);

    core::CompressionResult compress(const std::filesystem::path& source,
                                     const std::filesystem::path& destination,
                                     std::optional<core::CompressionMethod> method = std::nullopt) override;

    core::CompressionResult decompress(const std::filesystem::path& source,
                                       const std::filesystem::path& destination,
                                       std::optional<core::CompressionMethod> method = std::nullopt) override;

private:
    struct ArchiveTotals {
        int64_t bytes{0};
        int64_t files{0};
    };

    int64_t compressStream(const std::filesystem::path& source,
                           const std::filesystem::path& destination,
                           core::CompressionMethod method) const;
    int64_t decompressStream(const std::filesystem::path& source,
                             const std::filesystem::path& destination,
                             core::CompressionMethod method) const;

    int64_t gzipCompress(const std::filesystem::path& source,
                         const std::filesystem::path& destination) const;
    int64_t gzipDecompress(const std::filesystem::path& source,
                           const std::filesystem::path& destination) const;
    int64_t zstdCompress(const std::filesystem::path& source,
                         const std::filesystem::path& destination) const;
    int64_t zstdDecompress(const std::filesystem::path& source,
                           const std::filesystem::path& destination) const;

    ArchiveTotals writeArchive(const std::filesystem::path& source,
                               const std::filesystem::path& destination,
                               core::CompressionMethod method) const;
    ArchiveTotals extractArchive(const std::filesystem::path& source,
                                 const std::filesystem::path& destination,
                                 core::CompressionMethod method) const;

    Options options_;
};

} // namespace migengine::infra
