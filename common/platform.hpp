#pragma once

// ============================================================
// platform.hpp -- Portable types and small OS helpers
// ============================================================

#include <string>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <cerrno>

#ifdef _WIN32
#  error "seqferry targets POSIX systems (fork/exec, signals)"
#endif

#include <sys/types.h>
#include <unistd.h>

// ---- Portable types ----
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i8  = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

namespace platform {

inline bool is_tty(FILE* f) {
    return ::isatty(::fileno(f)) != 0;
}

inline std::string errno_str(int err) {
    return std::string(std::strerror(err)) + " (errno=" + std::to_string(err) + ")";
}

} // namespace platform
