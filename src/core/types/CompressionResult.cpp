#include "core/types/CompressionResult.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace migengine::core {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::string compressionMethodToString(CompressionMethod method) {
    switch (method) {
    case CompressionMethod::Gzip:
        return "gzip";
    case CompressionMethod::Zstd:
        return "zstd";
    case CompressionMethod::Tar:
        return "tar";
    case CompressionMethod::TarGzip:
        return "tar.gz";
    case CompressionMethod::TarZstd:
        return "tar.zst";
    }
    return "unknown";
}

CompressionMethod compressionMethodFromString(const std::string& name) {
    auto lower = toLower(name);
    if (lower == "gzip" || lower == "gz")
        return CompressionMethod::Gzip;
    if (lower == "zstd" || lower == "zst")
        return CompressionMethod::Zstd;
    if (lower == "tar")
        return CompressionMethod::Tar;
    if (lower == "tar.gz" || lower == "tgz" || lower == "tar.gzip")
        return CompressionMethod::TarGzip;
    if (lower == "tar.zst" || lower == "tar.zstd" || lower == "tzst")
        return CompressionMethod::TarZstd;

    throw std::invalid_argument("unsupported compression method: " + name);
}

CompressionMethod compressionMethodFromPath(const std::filesystem::path& path) {
    auto name = toLower(path.filename().string());

    // Compound suffixes first so "x.tar.gz" is not taken for plain gzip
    if (endsWith(name, ".tar.gz") || endsWith(name, ".tgz"))
        return CompressionMethod::TarGzip;
    if (endsWith(name, ".tar.zst") || endsWith(name, ".tar.zstd") || endsWith(name, ".tzst"))
        return CompressionMethod::TarZstd;
    if (endsWith(name, ".tar"))
        return CompressionMethod::Tar;
    if (endsWith(name, ".gz") || endsWith(name, ".gzip"))
        return CompressionMethod::Gzip;
    if (endsWith(name, ".zst") || endsWith(name, ".zstd"))
        return CompressionMethod::Zstd;

    throw std::invalid_argument("cannot infer compression method from file name: " +
                                path.filename().string());
}

double CompressionResult::ratio(int64_t compressed, int64_t original) {
    if (original <= 0 || compressed < 0) {
        return 0.0;
    }
    return static_cast<double>(compressed) / static_cast<double>(original);
}

} // namespace migengine::core
