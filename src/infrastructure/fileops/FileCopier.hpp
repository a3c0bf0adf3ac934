#pragma once

#include "core/services/IFileCopier.hpp"

#include <cstddef>

namespace migengine::infra {

/**
 * @brief Streaming file copier with on-the-fly SHA-256.
 *
 * Every chunk read from the source is written to the destination and fed to
 * the digest in the same pass, so the checksum describes exactly the bytes
 * written. Directory trees are copied with one task per regular file.
 * Implements the core::IFileCopier interface.
 */
class FileCopier : public core::IFileCopier {
public:
    /**
     * @brief Constructs a FileCopier.
     * @param bufferSize Chunk size used for each read/write pair.
     */
    explicit FileCopier(size_t bufferSize = 1024 * 1024);

    core::CopyResult copyFile(const std::filesystem::path& source,
                              const std::filesystem::path& destination) override;

    core::CopyResult copyDirectory(const std::filesystem::path& source,
                                   const std::filesystem::path& destination,
                                   int concurrency = 0) override;

private:
    size_t bufferSize_;
};

} // namespace migengine::infra
