#pragma once

#include "core/types/ChecksumResult.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace migengine::infra {

/**
 * @brief Incremental digest for a single algorithm, backed by OpenSSL EVP.
 */
class Digest {
public:
    explicit Digest(core::HashAlgorithm algorithm);
    ~Digest();

    Digest(Digest&& other) noexcept;
    Digest& operator=(Digest&& other) noexcept;

    Digest(const Digest&) = delete;
    Digest& operator=(const Digest&) = delete;

    /**
     * @brief Feeds bytes into the digest.
     */
    void update(const void* data, size_t size);

    /**
     * @brief Finishes the digest.
     * @return Lowercase hex digest. The object must not be updated afterwards.
     */
    std::string finalHex();

    core::HashAlgorithm algorithm() const { return algorithm_; }

private:
    core::HashAlgorithm algorithm_;
    evp_md_ctx_st* ctx_{nullptr};
};

/**
 * @brief Fan-out writer that feeds the same bytes to several digests.
 *
 * Lets a file be read once while all requested digests are computed.
 */
class MultiDigest {
public:
    explicit MultiDigest(const std::vector<core::HashAlgorithm>& algorithms);

    /**
     * @brief Feeds bytes into every digest.
     */
    void update(const void* data, size_t size);

    /**
     * @brief Finishes all digests.
     * @return Hex digests in the order the algorithms were given.
     */
    std::vector<std::string> finalHex();

private:
    std::vector<Digest> digests_;
};

/**
 * @brief Converts raw bytes to lowercase hex.
 */
std::string toHex(const unsigned char* data, size_t size);

} // namespace migengine::infra
