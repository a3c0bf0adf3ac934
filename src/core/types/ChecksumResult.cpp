#include "core/types/ChecksumResult.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace migengine::core {

std::string hashAlgorithmToString(HashAlgorithm algorithm) {
    switch (algorithm) {
    case HashAlgorithm::MD5:
        return "md5";
    case HashAlgorithm::SHA1:
        return "sha1";
    case HashAlgorithm::SHA256:
        return "sha256";
    }
    return "unknown";
}

HashAlgorithm hashAlgorithmFromString(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        if (c != '-' && c != '_') {
            lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }

    if (lower == "md5")
        return HashAlgorithm::MD5;
    if (lower == "sha1")
        return HashAlgorithm::SHA1;
    if (lower == "sha256")
        return HashAlgorithm::SHA256;

    throw std::invalid_argument("unsupported hash type: " + name);
}

const std::string& ChecksumResult::digest(HashAlgorithm algorithm) const {
    switch (algorithm) {
    case HashAlgorithm::MD5:
        return md5;
    case HashAlgorithm::SHA1:
        return sha1;
    case HashAlgorithm::SHA256:
        break;
    }
    return sha256;
}

size_t ChecksumBatch::failureCount() const {
    return static_cast<size_t>(std::count_if(results.begin(), results.end(),
                                             [](const ChecksumResult& r) { return !r.ok(); }));
}

} // namespace migengine::core
