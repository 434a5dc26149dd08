#pragma once

// ============================================================
// hash.hpp -- Streaming content digests (OpenSSL EVP + XXH3)
// ============================================================

#include "platform.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <stdexcept>

#include <openssl/evp.h>

// The XXH3 streaming API needs XXH_STATIC_LINKING_ONLY with libxxhash
#define XXH_STATIC_LINKING_ONLY
#include "xxhash.h"

namespace hash {

enum class DigestAlgo {
    MD5,
    SHA1,
    SHA256,
    XXH3_64,
};

const char* algo_name(DigestAlgo algo);

// "md5", "sha1", "sha256", "xxh3" (case-insensitive); false if unknown
bool parse_algo(const std::string& name, DigestAlgo& out);

// Hex digest length produced by algo
size_t hex_length(DigestAlgo algo);

// Lowercase hex of raw bytes
std::string to_hex(const u8* data, size_t len);

// Incremental digest over a byte stream
class StreamDigest {
public:
    virtual ~StreamDigest() = default;
    virtual void update(const void* data, size_t len) = 0;
    // Lowercase hex; call once
    virtual std::string hex_digest() = 0;
};

// Factory: throws std::runtime_error if the backend cannot be initialised
std::unique_ptr<StreamDigest> make_digest(DigestAlgo algo);

// OpenSSL EVP-backed digest (MD5, SHA-1, SHA-256)
class EvpDigest : public StreamDigest {
public:
    explicit EvpDigest(const EVP_MD* md) {
        ctx_ = EVP_MD_CTX_new();
        if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
        if (EVP_DigestInit_ex(ctx_, md, nullptr) != 1) {
            EVP_MD_CTX_free(ctx_);
            throw std::runtime_error("EVP_DigestInit_ex failed");
        }
    }

    ~EvpDigest() override {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EvpDigest(const EvpDigest&) = delete;
    EvpDigest& operator=(const EvpDigest&) = delete;

    void update(const void* data, size_t len) override {
        if (EVP_DigestUpdate(ctx_, data, len) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }

    std::string hex_digest() override {
        unsigned char out[EVP_MAX_MD_SIZE];
        unsigned int out_len = 0;
        if (EVP_DigestFinal_ex(ctx_, out, &out_len) != 1) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        return to_hex(out, out_len);
    }

private:
    EVP_MD_CTX* ctx_;
};

// Streaming xxh3_64, rendered big-endian as 16 hex digits
class Xxh3Digest : public StreamDigest {
public:
    Xxh3Digest() {
        state_ = XXH3_createState();
        if (!state_) throw std::runtime_error("XXH3_createState failed");
        XXH3_64bits_reset(state_);
    }

    ~Xxh3Digest() override {
        if (state_) XXH3_freeState(state_);
    }

    Xxh3Digest(const Xxh3Digest&) = delete;
    Xxh3Digest& operator=(const Xxh3Digest&) = delete;

    void update(const void* data, size_t len) override {
        XXH3_64bits_update(state_, data, len);
    }

    std::string hex_digest() override {
        u64 h = XXH3_64bits_digest(state_);
        u8 be[8];
        for (int i = 0; i < 8; ++i) {
            be[i] = (u8)(h >> (56 - 8 * i));
        }
        return to_hex(be, sizeof(be));
    }

private:
    XXH3_state_t* state_;
};

// One-shot xxh3_64 of a memory buffer, same rendering as Xxh3Digest
inline std::string xxh3_64_hex(const void* data, size_t len) {
    u64 h = XXH3_64bits(data, len);
    u8 be[8];
    for (int i = 0; i < 8; ++i) {
        be[i] = (u8)(h >> (56 - 8 * i));
    }
    return to_hex(be, sizeof(be));
}

} // namespace hash
