#include "infrastructure/fileops/Compressor.hpp"

#include "infrastructure/fileops/FileHandle.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <zlib.h>
#include <zstd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace migengine::infra {

namespace {

using Clock = std::chrono::steady_clock;

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const { archive_read_free(a); }
};
struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};
struct ArchiveEntryDeleter {
    void operator()(struct archive_entry* e) const { archive_entry_free(e); }
};
struct ZstdCCtxDeleter {
    void operator()(ZSTD_CCtx* ctx) const { ZSTD_freeCCtx(ctx); }
};
struct ZstdDCtxDeleter {
    void operator()(ZSTD_DCtx* ctx) const { ZSTD_freeDCtx(ctx); }
};

using ArchiveReader = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriter = std::unique_ptr<struct archive, ArchiveWriteDeleter>;
using ArchiveEntry = std::unique_ptr<struct archive_entry, ArchiveEntryDeleter>;

std::string archiveError(struct archive* a) {
    const char* message = archive_error_string(a);
    return message != nullptr ? message : "unknown archive error";
}

std::string zlibError(const z_stream& stream, int code) {
    if (stream.msg != nullptr) {
        return stream.msg;
    }
    return "zlib error " + std::to_string(code);
}

void createParentDirectories(const std::filesystem::path& path) {
    auto parent = path.parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw std::runtime_error("failed to create directory " + parent.string() + ": " +
                                 ec.message());
    }
}

int64_t fileSize(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("failed to stat " + path.string() + ": " + ec.message());
    }
    return static_cast<int64_t>(size);
}

/// Rejects absolute names and any ".." component.
bool isSafeEntryName(const std::filesystem::path& name) {
    if (name.empty() || name.is_absolute() || name.has_root_name()) {
        return false;
    }
    return std::none_of(name.begin(), name.end(),
                        [](const std::filesystem::path& part) { return part == ".."; });
}

/// True when path, with the symlinks that already exist resolved, stays under root.
bool resolvesInside(const std::filesystem::path& root, const std::filesystem::path& path) {
    std::error_code ec;
    auto resolved = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        return false;
    }
    auto diverge = std::mismatch(root.begin(), root.end(), resolved.begin(), resolved.end());
    return diverge.first == root.end();
}

/// Frees the zlib stream state on scope exit.
class DeflateGuard {
public:
    explicit DeflateGuard(z_stream& stream) : stream_(stream) {}
    ~DeflateGuard() { deflateEnd(&stream_); }
    DeflateGuard(const DeflateGuard&) = delete;
    DeflateGuard& operator=(const DeflateGuard&) = delete;

private:
    z_stream& stream_;
};

class InflateGuard {
public:
    explicit InflateGuard(z_stream& stream) : stream_(stream) {}
    ~InflateGuard() { inflateEnd(&stream_); }
    InflateGuard(const InflateGuard&) = delete;
    InflateGuard& operator=(const InflateGuard&) = delete;

private:
    z_stream& stream_;
};

} // namespace

Compressor::Compressor() : Compressor(Options{}) {}

Compressor::Compressor(Options options) : options_(options) {
    if (options_.chunkSize == 0) {
        options_.chunkSize = 256 * 1024;
    }
    options_.gzipLevel = std::clamp(options_.gzipLevel, 1, 9);
    options_.zstdLevel = std::clamp(options_.zstdLevel, 1, 19);
}

core::CompressionResult Compressor::compress(const std::filesystem::path& source,
                                             const std::filesystem::path& destination,
                                             std::optional<core::CompressionMethod> method) {
    auto start = Clock::now();
    auto resolved = method ? *method : core::compressionMethodFromPath(destination);

    std::error_code ec;
    auto status = std::filesystem::status(source, ec);
    if (ec || !std::filesystem::exists(status)) {
        throw std::runtime_error("failed to stat source " + source.string() + ": " +
                                 (ec ? ec.message() : "no such file or directory"));
    }

    bool isDirectory = std::filesystem::is_directory(status);
    if (isDirectory && !core::isArchiveMethod(resolved)) {
        throw std::invalid_argument("method " + core::compressionMethodToString(resolved) +
                                    " cannot compress a directory; use tar, tar.gz or tar.zst");
    }

    createParentDirectories(destination);

    core::CompressionResult result;
    result.method = resolved;

    if (core::isArchiveMethod(resolved)) {
        auto totals = writeArchive(source, destination, resolved);
        result.originalSize = totals.bytes;
        result.fileCount = totals.files;
    } else {
        result.originalSize = compressStream(source, destination, resolved);
        result.fileCount = 1;
    }

    result.compressedSize = fileSize(destination);
    result.compressionRatio = core::CompressionResult::ratio(result.compressedSize,
                                                             result.originalSize);
    result.duration = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
    result.success = true;

    spdlog::info("Compressed {} -> {} ({}, {} -> {} bytes, ratio {:.3f})", source.string(),
                 destination.string(), result.methodName(), result.originalSize,
                 result.compressedSize, result.compressionRatio);
    return result;
}

core::CompressionResult Compressor::decompress(const std::filesystem::path& source,
                                               const std::filesystem::path& destination,
                                               std::optional<core::CompressionMethod> method) {
    auto start = Clock::now();
    auto resolved = method ? *method : core::compressionMethodFromPath(source);

    core::CompressionResult result;
    result.method = resolved;
    result.compressedSize = fileSize(source);

    if (core::isArchiveMethod(resolved)) {
        auto totals = extractArchive(source, destination, resolved);
        result.originalSize = totals.bytes;
        result.fileCount = totals.files;
    } else {
        createParentDirectories(destination);
        result.originalSize = decompressStream(source, destination, resolved);
        result.fileCount = 1;
    }

    result.compressionRatio = core::CompressionResult::ratio(result.compressedSize,
                                                             result.originalSize);
    result.duration = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
    result.success = true;

    spdlog::info("Decompressed {} -> {} ({}, {} files, {} bytes)", source.string(),
                 destination.string(), result.methodName(), result.fileCount,
                 result.originalSize);
    return result;
}

int64_t Compressor::compressStream(const std::filesystem::path& source,
                                   const std::filesystem::path& destination,
                                   core::CompressionMethod method) const {
    switch (method) {
        case core::CompressionMethod::Gzip:
            return gzipCompress(source, destination);
        case core::CompressionMethod::Zstd:
            return zstdCompress(source, destination);
        default:
            throw std::invalid_argument("not a stream method: " +
                                        core::compressionMethodToString(method));
    }
}

int64_t Compressor::decompressStream(const std::filesystem::path& source,
                                     const std::filesystem::path& destination,
                                     core::CompressionMethod method) const {
    switch (method) {
        case core::CompressionMethod::Gzip:
            return gzipDecompress(source, destination);
        case core::CompressionMethod::Zstd:
            return zstdDecompress(source, destination);
        default:
            throw std::invalid_argument("not a stream method: " +
                                        core::compressionMethodToString(method));
    }
}

int64_t Compressor::gzipCompress(const std::filesystem::path& source,
                                 const std::filesystem::path& destination) const {
    auto input = FileHandle::openForRead(source);
    auto output = FileHandle::create(destination);

    z_stream stream{};
    // windowBits 15 + 16 selects the gzip wrapper
    int rc = deflateInit2(&stream, options_.gzipLevel, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        throw std::runtime_error("failed to initialise gzip encoder: " + zlibError(stream, rc));
    }
    DeflateGuard guard(stream);

    std::vector<char> in(options_.chunkSize);
    std::vector<char> out(options_.chunkSize);
    int64_t total = 0;

    int flush = Z_NO_FLUSH;
    do {
        size_t n = input.read(in.data(), in.size());
        total += static_cast<int64_t>(n);
        flush = n == 0 ? Z_FINISH : Z_NO_FLUSH;
        stream.next_in = reinterpret_cast<Bytef*>(in.data());
        stream.avail_in = static_cast<uInt>(n);

        do {
            stream.next_out = reinterpret_cast<Bytef*>(out.data());
            stream.avail_out = static_cast<uInt>(out.size());
            rc = deflate(&stream, flush);
            if (rc == Z_STREAM_ERROR) {
                throw std::runtime_error("gzip encoder failed: " + zlibError(stream, rc));
            }
            output.writeAll(out.data(), out.size() - stream.avail_out);
        } while (stream.avail_out == 0);
    } while (flush != Z_FINISH);

    output.sync();
    output.close();
    return total;
}

int64_t Compressor::gzipDecompress(const std::filesystem::path& source,
                                   const std::filesystem::path& destination) const {
    auto input = FileHandle::openForRead(source);
    auto output = FileHandle::create(destination);

    z_stream stream{};
    int rc = inflateInit2(&stream, 15 + 16);
    if (rc != Z_OK) {
        throw std::runtime_error("failed to initialise gzip decoder: " + zlibError(stream, rc));
    }
    InflateGuard guard(stream);

    std::vector<char> in(options_.chunkSize);
    std::vector<char> out(options_.chunkSize);
    int64_t total = 0;
    bool memberEnded = false;

    while (true) {
        size_t n = input.read(in.data(), in.size());
        if (n == 0) {
            break;
        }
        stream.next_in = reinterpret_cast<Bytef*>(in.data());
        stream.avail_in = static_cast<uInt>(n);

        do {
            if (memberEnded) {
                if (stream.avail_in == 0) {
                    break;
                }
                // Concatenated gzip members decode as one stream
                if (inflateReset(&stream) != Z_OK) {
                    throw std::runtime_error("failed to reset gzip decoder");
                }
                memberEnded = false;
            }

            stream.next_out = reinterpret_cast<Bytef*>(out.data());
            stream.avail_out = static_cast<uInt>(out.size());
            rc = inflate(&stream, Z_NO_FLUSH);
            if (rc == Z_STREAM_END) {
                memberEnded = true;
            } else if (rc != Z_OK && rc != Z_BUF_ERROR) {
                throw std::runtime_error("invalid gzip stream in " + source.string() + ": " +
                                         zlibError(stream, rc));
            }

            size_t produced = out.size() - stream.avail_out;
            output.writeAll(out.data(), produced);
            total += static_cast<int64_t>(produced);

            if (rc == Z_BUF_ERROR) {
                break;
            }
        } while (stream.avail_out == 0 || stream.avail_in > 0);
    }

    if (!memberEnded) {
        throw std::runtime_error("truncated gzip stream in " + source.string());
    }

    output.sync();
    output.close();
    return total;
}

int64_t Compressor::zstdCompress(const std::filesystem::path& source,
                                 const std::filesystem::path& destination) const {
    auto input = FileHandle::openForRead(source);
    auto output = FileHandle::create(destination);

    std::unique_ptr<ZSTD_CCtx, ZstdCCtxDeleter> ctx(ZSTD_createCCtx());
    if (!ctx) {
        throw std::runtime_error("failed to create zstd encoder");
    }
    ZSTD_CCtx_setParameter(ctx.get(), ZSTD_c_compressionLevel, options_.zstdLevel);
    ZSTD_CCtx_setParameter(ctx.get(), ZSTD_c_checksumFlag, 1);

    std::vector<char> in(std::max(options_.chunkSize, ZSTD_CStreamInSize()));
    std::vector<char> out(ZSTD_CStreamOutSize());
    int64_t total = 0;

    while (true) {
        size_t n = input.read(in.data(), in.size());
        total += static_cast<int64_t>(n);
        auto mode = n == 0 ? ZSTD_e_end : ZSTD_e_continue;
        ZSTD_inBuffer inBuffer{in.data(), n, 0};

        bool finished = false;
        do {
            ZSTD_outBuffer outBuffer{out.data(), out.size(), 0};
            size_t remaining = ZSTD_compressStream2(ctx.get(), &outBuffer, &inBuffer, mode);
            if (ZSTD_isError(remaining)) {
                throw std::runtime_error(std::string("zstd encoder failed: ") +
                                         ZSTD_getErrorName(remaining));
            }
            output.writeAll(out.data(), outBuffer.pos);
            finished = mode == ZSTD_e_end ? remaining == 0 : inBuffer.pos == inBuffer.size;
        } while (!finished);

        if (mode == ZSTD_e_end) {
            break;
        }
    }

    output.sync();
    output.close();
    return total;
}

int64_t Compressor::zstdDecompress(const std::filesystem::path& source,
                                   const std::filesystem::path& destination) const {
    auto input = FileHandle::openForRead(source);
    auto output = FileHandle::create(destination);

    std::unique_ptr<ZSTD_DCtx, ZstdDCtxDeleter> ctx(ZSTD_createDCtx());
    if (!ctx) {
        throw std::runtime_error("failed to create zstd decoder");
    }

    std::vector<char> in(std::max(options_.chunkSize, ZSTD_DStreamInSize()));
    std::vector<char> out(ZSTD_DStreamOutSize());
    int64_t total = 0;
    // Non-zero until a frame has been fully decoded and flushed
    size_t lastResult = 1;

    while (true) {
        size_t n = input.read(in.data(), in.size());
        if (n == 0) {
            break;
        }
        ZSTD_inBuffer inBuffer{in.data(), n, 0};

        bool outputFull = false;
        do {
            ZSTD_outBuffer outBuffer{out.data(), out.size(), 0};
            lastResult = ZSTD_decompressStream(ctx.get(), &outBuffer, &inBuffer);
            if (ZSTD_isError(lastResult)) {
                throw std::runtime_error("invalid zstd stream in " + source.string() + ": " +
                                         ZSTD_getErrorName(lastResult));
            }
            output.writeAll(out.data(), outBuffer.pos);
            total += static_cast<int64_t>(outBuffer.pos);
            outputFull = outBuffer.pos == outBuffer.size;
        } while (inBuffer.pos < inBuffer.size || outputFull);
    }

    if (lastResult != 0) {
        throw std::runtime_error("truncated zstd stream in " + source.string());
    }

    output.sync();
    output.close();
    return total;
}

Compressor::ArchiveTotals Compressor::writeArchive(const std::filesystem::path& source,
                                                   const std::filesystem::path& destination,
                                                   core::CompressionMethod method) const {
    struct PendingEntry {
        std::filesystem::path path;
        std::filesystem::path name;
    };
    std::vector<PendingEntry> entries;

    try {
        if (std::filesystem::is_directory(source)) {
            for (const auto& entry : std::filesystem::recursive_directory_iterator(source)) {
                entries.push_back({entry.path(), entry.path().lexically_relative(source)});
            }
            std::sort(entries.begin(), entries.end(),
                      [](const PendingEntry& a, const PendingEntry& b) { return a.name < b.name; });
        } else {
            entries.push_back({source, source.filename()});
        }
    } catch (const std::filesystem::filesystem_error& e) {
        throw std::runtime_error("failed to walk " + source.string() + ": " + e.what());
    }

    ArchiveWriter writer(archive_write_new());
    if (!writer) {
        throw std::runtime_error("failed to allocate archive writer");
    }

    archive_write_set_format_pax_restricted(writer.get());
    int rc = ARCHIVE_OK;
    switch (method) {
        case core::CompressionMethod::TarGzip:
            rc = archive_write_add_filter_gzip(writer.get());
            break;
        case core::CompressionMethod::TarZstd:
            rc = archive_write_add_filter_zstd(writer.get());
            break;
        default:
            rc = archive_write_add_filter_none(writer.get());
            break;
    }
    if (rc != ARCHIVE_OK) {
        throw std::runtime_error("failed to configure archive filter: " +
                                 archiveError(writer.get()));
    }

    if (archive_write_open_filename(writer.get(), destination.c_str()) != ARCHIVE_OK) {
        throw std::runtime_error("failed to create archive " + destination.string() + ": " +
                                 archiveError(writer.get()));
    }

    ArchiveTotals totals;
    std::vector<char> buffer(options_.chunkSize);

    for (const auto& pending : entries) {
        struct stat st {};
        if (::lstat(pending.path.c_str(), &st) != 0) {
            throw std::runtime_error("failed to stat " + pending.path.string() + ": " +
                                     std::strerror(errno));
        }

        bool isRegular = S_ISREG(st.st_mode);
        bool isDirectory = S_ISDIR(st.st_mode);
        bool isSymlink = S_ISLNK(st.st_mode);
        if (!isRegular && !isDirectory && !isSymlink) {
            spdlog::warn("Skipping special file {}", pending.path.string());
            continue;
        }

        ArchiveEntry entry(archive_entry_new());
        archive_entry_copy_stat(entry.get(), &st);
        archive_entry_set_pathname(entry.get(), pending.name.generic_string().c_str());
        if (isSymlink) {
            auto target = std::filesystem::read_symlink(pending.path);
            archive_entry_set_symlink(entry.get(), target.c_str());
        }
        if (!isRegular) {
            archive_entry_set_size(entry.get(), 0);
        }

        rc = archive_write_header(writer.get(), entry.get());
        if (rc < ARCHIVE_WARN) {
            throw std::runtime_error("failed to write tar header for " + pending.name.string() +
                                     ": " + archiveError(writer.get()));
        }
        if (rc == ARCHIVE_WARN) {
            spdlog::warn("Archive warning for {}: {}", pending.name.string(),
                         archiveError(writer.get()));
        }

        if (!isRegular) {
            continue;
        }

        auto input = FileHandle::openForRead(pending.path);
        while (true) {
            size_t n = input.read(buffer.data(), buffer.size());
            if (n == 0) {
                break;
            }
            if (archive_write_data(writer.get(), buffer.data(), n) < 0) {
                throw std::runtime_error("failed to write file content for " +
                                         pending.name.string() + ": " +
                                         archiveError(writer.get()));
            }
            totals.bytes += static_cast<int64_t>(n);
        }
        ++totals.files;
    }

    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        throw std::runtime_error("failed to finalise archive " + destination.string() + ": " +
                                 archiveError(writer.get()));
    }

    spdlog::debug("Archived {} files ({} bytes) into {}", totals.files, totals.bytes,
                  destination.string());
    return totals;
}

Compressor::ArchiveTotals Compressor::extractArchive(const std::filesystem::path& source,
                                                     const std::filesystem::path& destination,
                                                     core::CompressionMethod method) const {
    ArchiveReader reader(archive_read_new());
    if (!reader) {
        throw std::runtime_error("failed to allocate archive reader");
    }

    archive_read_support_format_tar(reader.get());
    switch (method) {
        case core::CompressionMethod::TarGzip:
            archive_read_support_filter_gzip(reader.get());
            break;
        case core::CompressionMethod::TarZstd:
            archive_read_support_filter_zstd(reader.get());
            break;
        default:
            archive_read_support_filter_none(reader.get());
            break;
    }

    if (archive_read_open_filename(reader.get(), source.c_str(), options_.chunkSize) !=
        ARCHIVE_OK) {
        throw std::runtime_error("failed to open archive " + source.string() + ": " +
                                 archiveError(reader.get()));
    }

    std::error_code ec;
    std::filesystem::create_directories(destination, ec);
    if (ec) {
        throw std::runtime_error("failed to create directory " + destination.string() + ": " +
                                 ec.message());
    }

    auto root = std::filesystem::canonical(destination, ec);
    if (ec) {
        throw std::runtime_error("failed to resolve " + destination.string() + ": " +
                                 ec.message());
    }

    ArchiveTotals totals;
    std::vector<char> buffer(options_.chunkSize);
    // Directory modes are applied last so read-only directories can still be filled
    std::vector<std::pair<std::filesystem::path, mode_t>> directoryModes;

    while (true) {
        struct archive_entry* entry = nullptr;
        int rc = archive_read_next_header(reader.get(), &entry);
        if (rc == ARCHIVE_EOF) {
            break;
        }
        if (rc < ARCHIVE_WARN) {
            throw std::runtime_error("failed to read tar header: " + archiveError(reader.get()));
        }

        std::filesystem::path name(archive_entry_pathname(entry));
        if (!isSafeEntryName(name)) {
            throw std::runtime_error("archive entry escapes destination: " + name.string());
        }

        auto target = (root / name).lexically_normal();
        auto mode = static_cast<mode_t>(archive_entry_perm(entry));

        // Earlier symlink entries must not redirect this entry outside the root
        if (!resolvesInside(root, target.parent_path())) {
            throw std::runtime_error("archive entry escapes destination: " + name.string());
        }

        switch (archive_entry_filetype(entry)) {
            case AE_IFDIR:
                if (!resolvesInside(root, target)) {
                    throw std::runtime_error("archive entry escapes destination: " +
                                             name.string());
                }
                std::filesystem::create_directories(target, ec);
                if (ec) {
                    throw std::runtime_error("failed to create directory " + target.string() +
                                             ": " + ec.message());
                }
                directoryModes.emplace_back(target, mode);
                break;

            case AE_IFREG: {
                createParentDirectories(target);
                if (std::filesystem::is_symlink(std::filesystem::symlink_status(target, ec))) {
                    std::filesystem::remove(target, ec);
                }
                auto output = FileHandle::create(target, mode);
                while (true) {
                    la_ssize_t n = archive_read_data(reader.get(), buffer.data(), buffer.size());
                    if (n < 0) {
                        throw std::runtime_error("failed to read " + name.string() +
                                                 " from archive: " + archiveError(reader.get()));
                    }
                    if (n == 0) {
                        break;
                    }
                    output.writeAll(buffer.data(), static_cast<size_t>(n));
                    totals.bytes += n;
                }
                output.close();
                if (::chmod(target.c_str(), mode) != 0) {
                    throw std::runtime_error("failed to set mode on " + target.string() + ": " +
                                             std::strerror(errno));
                }
                ++totals.files;
                break;
            }

            case AE_IFLNK: {
                const char* link = archive_entry_symlink(entry);
                std::filesystem::path linkTarget(link != nullptr ? link : "");
                if (linkTarget.empty() || linkTarget.is_absolute() ||
                    !resolvesInside(root, target.parent_path() / linkTarget)) {
                    throw std::runtime_error("symlink " + name.string() +
                                             " points outside destination: " +
                                             linkTarget.string());
                }
                createParentDirectories(target);
                std::filesystem::remove(target, ec);
                std::filesystem::create_symlink(linkTarget, target, ec);
                if (ec) {
                    throw std::runtime_error("failed to create symlink " + target.string() +
                                             ": " + ec.message());
                }
                break;
            }

            default:
                spdlog::debug("Skipping unsupported archive entry {}", name.string());
                archive_read_data_skip(reader.get());
                break;
        }
    }

    for (auto it = directoryModes.rbegin(); it != directoryModes.rend(); ++it) {
        if (::chmod(it->first.c_str(), it->second) != 0) {
            throw std::runtime_error("failed to set mode on " + it->first.string() + ": " +
                                     std::strerror(errno));
        }
    }

    return totals;
}

} // namespace migengine::infra
