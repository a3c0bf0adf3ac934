#include "infrastructure/fileops/FileHandle.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace migengine::infra {

namespace {

[[noreturn]] void throwErrno(const std::string& what, const std::filesystem::path& path) {
    throw std::runtime_error(what + " " + path.string() + ": " + std::strerror(errno));
}

} // namespace

FileHandle::FileHandle(int fd, std::filesystem::path path) : fd_(fd), path_(std::move(path)) {}

FileHandle::~FileHandle() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

FileHandle::FileHandle(FileHandle&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
    }
    return *this;
}

FileHandle FileHandle::openForRead(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throwErrno("failed to open", path);
    }
    return FileHandle(fd, path);
}

FileHandle FileHandle::create(const std::filesystem::path& path, mode_t mode) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) {
        throwErrno("failed to create", path);
    }
    return FileHandle(fd, path);
}

size_t FileHandle::read(char* buffer, size_t size) {
    while (true) {
        ssize_t n = ::read(fd_, buffer, size);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno != EINTR) {
            throwErrno("failed to read", path_);
        }
    }
}

void FileHandle::writeAll(const char* data, size_t size) {
    while (size > 0) {
        ssize_t n = ::write(fd_, data, size);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throwErrno("failed to write", path_);
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
}

void FileHandle::sync() {
    if (::fsync(fd_) != 0) {
        throwErrno("failed to sync", path_);
    }
}

int64_t FileHandle::size() const {
    struct stat st {};
    if (::fstat(fd_, &st) != 0) {
        throwErrno("failed to stat", path_);
    }
    return static_cast<int64_t>(st.st_size);
}

void FileHandle::close() {
    if (fd_ < 0) {
        return;
    }
    int fd = std::exchange(fd_, -1);
    if (::close(fd) != 0) {
        throwErrno("failed to close", path_);
    }
}

} // namespace migengine::infra
