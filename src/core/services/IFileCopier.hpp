/**
 * @file IFileCopier.hpp
 * @brief Interface for verified file and directory copies.
 */

#pragma once

#include "core/types/CopyResult.hpp"

#include <filesystem>

namespace migengine::core {

/**
 * @brief Interface for copying files while computing their digest.
 */
class IFileCopier {
public:
    virtual ~IFileCopier() = default;

    /**
     * @brief Copies one file, hashing the bytes as they are written.
     * @param source File to copy.
     * @param destination Target path, parent directories are created.
     * @return Copy statistics including the SHA-256 of the written stream.
     * @throws std::runtime_error on any open, write, sync or permission failure.
     */
    virtual CopyResult copyFile(const std::filesystem::path& source,
                                const std::filesystem::path& destination) = 0;

    /**
     * @brief Copies a directory tree with per-file parallelism.
     * @param source Directory to copy.
     * @param destination Target directory.
     * @param concurrency Maximum files copied at once, 0 for one task per file.
     * @return Summed bytes and total duration. No per-file digests.
     * @throws std::runtime_error with the first per-file error once all copies finish.
     */
    virtual CopyResult copyDirectory(const std::filesystem::path& source,
                                     const std::filesystem::path& destination,
                                     int concurrency = 0) = 0;
};

} // namespace migengine::core
