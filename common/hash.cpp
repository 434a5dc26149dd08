// ============================================================
// hash.cpp -- Digest factory and helpers
// ============================================================

#include "hash.hpp"
#include "utils.hpp"

namespace hash {

const char* algo_name(DigestAlgo algo) {
    switch (algo) {
        case DigestAlgo::MD5:     return "md5";
        case DigestAlgo::SHA1:    return "sha1";
        case DigestAlgo::SHA256:  return "sha256";
        case DigestAlgo::XXH3_64: return "xxh3";
    }
    return "?";
}

bool parse_algo(const std::string& name, DigestAlgo& out) {
    std::string n = utils::to_lower(utils::trim(name));
    if (n == "md5")                    { out = DigestAlgo::MD5;     return true; }
    if (n == "sha1" || n == "sha-1")   { out = DigestAlgo::SHA1;    return true; }
    if (n == "sha256" || n == "sha-256") { out = DigestAlgo::SHA256; return true; }
    if (n == "xxh3" || n == "xxh3_64") { out = DigestAlgo::XXH3_64; return true; }
    return false;
}

size_t hex_length(DigestAlgo algo) {
    switch (algo) {
        case DigestAlgo::MD5:     return 32;
        case DigestAlgo::SHA1:    return 40;
        case DigestAlgo::SHA256:  return 64;
        case DigestAlgo::XXH3_64: return 16;
    }
    return 0;
}

std::string to_hex(const u8* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

std::unique_ptr<StreamDigest> make_digest(DigestAlgo algo) {
    switch (algo) {
        case DigestAlgo::MD5:     return std::make_unique<EvpDigest>(EVP_md5());
        case DigestAlgo::SHA1:    return std::make_unique<EvpDigest>(EVP_sha1());
        case DigestAlgo::SHA256:  return std::make_unique<EvpDigest>(EVP_sha256());
        case DigestAlgo::XXH3_64: return std::make_unique<Xxh3Digest>();
    }
    throw std::runtime_error("unknown digest algorithm");
}

} // namespace hash
