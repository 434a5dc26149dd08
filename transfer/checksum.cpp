// ============================================================
// checksum.cpp -- Streamed file digest verification
// ============================================================

#include "checksum.hpp"
#include "../common/file_io.hpp"
#include "../common/utils.hpp"
#include <cctype>
#include <stdexcept>
#include <vector>

namespace checksum {

static bool is_hex(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isxdigit((unsigned char)c)) return false;
    }
    return true;
}

bool parse_expected(const std::string& text, ExpectedDigest& out) {
    std::string value = utils::trim(text);
    hash::DigestAlgo algo = hash::DigestAlgo::MD5;

    size_t colon = value.find(':');
    if (colon != std::string::npos) {
        if (!hash::parse_algo(value.substr(0, colon), algo)) return false;
        value = value.substr(colon + 1);
        if (value.size() != hash::hex_length(algo)) return false;
    } else {
        switch (value.size()) {
        case 32: algo = hash::DigestAlgo::MD5;     break;
        case 40: algo = hash::DigestAlgo::SHA1;    break;
        case 64: algo = hash::DigestAlgo::SHA256;  break;
        case 16: algo = hash::DigestAlgo::XXH3_64; break;
        default: return false;
        }
    }

    if (!is_hex(value)) return false;
    out.algo = algo;
    out.hex  = utils::to_lower(value);
    return true;
}

std::string file_digest(const std::string& path, hash::DigestAlgo algo, size_t chunk_size) {
    if (chunk_size == 0) chunk_size = 64 * 1024;

    auto digest = hash::make_digest(algo);
    file_io::FileReader reader(path);
    std::vector<char> chunk(chunk_size);

    for (;;) {
        size_t n = reader.read(chunk.data(), chunk.size());
        if (n == 0) break;
        digest->update(chunk.data(), n);
    }
    return digest->hex_digest();
}

bool verify(const std::string& path, const std::string& expected_hex,
            hash::DigestAlgo algo, size_t chunk_size) {
    std::string want = utils::to_lower(utils::trim(expected_hex));
    // Tolerate an "algo:" prefix on the expected value
    size_t colon = want.find(':');
    if (colon != std::string::npos) want = want.substr(colon + 1);

    return file_digest(path, algo, chunk_size) == want;
}

bool verify(const std::string& path, const std::string& expected) {
    ExpectedDigest exp;
    if (!parse_expected(expected, exp)) {
        throw std::invalid_argument("unrecognised checksum '" + expected + "'");
    }
    return verify(path, exp.hex, exp.algo);
}

} // namespace checksum
