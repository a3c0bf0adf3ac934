#pragma once

#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace migengine::infra {

/**
 * @brief Owning wrapper around a POSIX file descriptor.
 *
 * All operations throw std::runtime_error carrying the path and errno text
 * on failure. The descriptor is closed on destruction.
 */
class FileHandle {
public:
    FileHandle() = default;
    ~FileHandle();

    FileHandle(FileHandle&& other) noexcept;
    FileHandle& operator=(FileHandle&& other) noexcept;

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    /**
     * @brief Opens an existing file for reading.
     * @param path File to open.
     * @return Open handle.
     */
    static FileHandle openForRead(const std::filesystem::path& path);

    /**
     * @brief Creates or truncates a file for writing.
     * @param path File to create.
     * @param mode Permission bits used when the file is created.
     * @return Open handle.
     */
    static FileHandle create(const std::filesystem::path& path, mode_t mode = 0644);

    /**
     * @brief Reads up to size bytes, retrying on EINTR.
     * @return Bytes read, 0 at end of file.
     */
    size_t read(char* buffer, size_t size);

    /**
     * @brief Writes the whole buffer, looping over short writes.
     */
    void writeAll(const char* data, size_t size);

    /**
     * @brief Flushes file data and metadata to the device.
     */
    void sync();

    /**
     * @brief Returns the current file size from fstat.
     */
    int64_t size() const;

    /**
     * @brief Closes the descriptor, reporting errors from close().
     */
    void close();

    int fd() const { return fd_; }
    bool isOpen() const { return fd_ >= 0; }
    const std::filesystem::path& path() const { return path_; }

private:
    FileHandle(int fd, std::filesystem::path path);

    int fd_{-1};
    std::filesystem::path path_;
};

} // namespace migengine::infra
