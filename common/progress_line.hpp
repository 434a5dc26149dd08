#pragma once

// ============================================================
// progress_line.hpp -- Single-line in-place download progress
// ============================================================

#include "platform.hpp"
#include <string>
#include <mutex>
#include <unordered_map>

class ProgressLine {
public:
    // tty: overwrite one line with '\r'; otherwise print one line per 10% step
    explicit ProgressLine(bool tty = platform::is_tty(stdout));

    // bytes received so far out of total
    void update(const std::string& label, u64 bytes, u64 total);

    // Block size exceeds the file size: the file arrives in one read
    void single_block(const std::string& label, u64 total);

    // Download finished (or stopped); terminates the in-place line
    void finish(const std::string& label, u64 bytes, u64 total);

    static std::string format(const std::string& label, u64 bytes, u64 total);

private:
    bool tty_;
    std::mutex mutex_;
    std::unordered_map<std::string, int> last_step_; // non-tty: last 10% step printed
};
