#pragma once

// ============================================================
// checksum.hpp -- Streamed file digest verification
// ============================================================

#include "../common/hash.hpp"
#include <string>

namespace checksum {

struct ExpectedDigest {
    hash::DigestAlgo algo{hash::DigestAlgo::MD5};
    std::string hex;  // lowercase
};

// Parse "algo:hex" or bare hex. A bare value picks its algorithm from the
// hex length (32 md5, 40 sha1, 64 sha256, 16 xxh3). False if neither the
// prefix nor the length identifies an algorithm, or the value is not hex.
bool parse_expected(const std::string& text, ExpectedDigest& out);

// Lowercase hex digest of a file, read chunk_size bytes at a time.
// Throws std::runtime_error if the file cannot be read.
std::string file_digest(const std::string& path, hash::DigestAlgo algo,
                        size_t chunk_size = 64 * 1024);

// True iff the digest of path equals expected_hex, ignoring case
bool verify(const std::string& path, const std::string& expected_hex,
            hash::DigestAlgo algo, size_t chunk_size = 64 * 1024);

// As above with the algorithm taken from the expected value itself.
// Throws std::invalid_argument if it cannot be parsed.
bool verify(const std::string& path, const std::string& expected);

} // namespace checksum
