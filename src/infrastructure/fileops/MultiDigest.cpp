#include "infrastructure/fileops/MultiDigest.hpp"

#include <openssl/evp.h>

#include <stdexcept>
#include <utility>

namespace migengine::infra {

namespace {

const EVP_MD* evpFor(core::HashAlgorithm algorithm) {
    switch (algorithm) {
    case core::HashAlgorithm::MD5:
        return EVP_md5();
    case core::HashAlgorithm::SHA1:
        return EVP_sha1();
    case core::HashAlgorithm::SHA256:
        return EVP_sha256();
    }
    throw std::invalid_argument("unsupported hash algorithm");
}

} // namespace

std::string toHex(const unsigned char* data, size_t size) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0F]);
    }
    return hex;
}

Digest::Digest(core::HashAlgorithm algorithm) : algorithm_(algorithm), ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("failed to allocate digest context");
    }
    if (EVP_DigestInit_ex(ctx_, evpFor(algorithm), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        ctx_ = nullptr;
        throw std::runtime_error("failed to initialise " + core::hashAlgorithmToString(algorithm) +
                                 " digest");
    }
}

Digest::~Digest() {
    if (ctx_) {
        EVP_MD_CTX_free(ctx_);
    }
}

Digest::Digest(Digest&& other) noexcept
    : algorithm_(other.algorithm_), ctx_(std::exchange(other.ctx_, nullptr)) {}

Digest& Digest::operator=(Digest&& other) noexcept {
    if (this != &other) {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
        algorithm_ = other.algorithm_;
        ctx_ = std::exchange(other.ctx_, nullptr);
    }
    return *this;
}

void Digest::update(const void* data, size_t size) {
    if (EVP_DigestUpdate(ctx_, data, size) != 1) {
        throw std::runtime_error("digest update failed");
    }
}

std::string Digest::finalHex() {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_, md, &length) != 1) {
        throw std::runtime_error("digest finalisation failed");
    }
    return toHex(md, length);
}

MultiDigest::MultiDigest(const std::vector<core::HashAlgorithm>& algorithms) {
    digests_.reserve(algorithms.size());
    for (auto algorithm : algorithms) {
        digests_.emplace_back(algorithm);
    }
}

void MultiDigest::update(const void* data, size_t size) {
    for (auto& digest : digests_) {
        digest.update(data, size);
    }
}

std::vector<std::string> MultiDigest::finalHex() {
    std::vector<std::string> hex;
    hex.reserve(digests_.size());
    for (auto& digest : digests_) {
        hex.push_back(digest.finalHex());
    }
    return hex;
}

} // namespace migengine::infra
