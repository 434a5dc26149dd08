// ============================================================
// progress_line.cpp -- Single-line in-place download progress
// ============================================================

#include "progress_line.hpp"
#include "logger.hpp"
#include "utils.hpp"

ProgressLine::ProgressLine(bool tty) : tty_(tty) {}

std::string ProgressLine::format(const std::string& label, u64 bytes, u64 total) {
    std::string s = label + "  " + std::to_string(bytes);
    if (total > 0) {
        s += "  [" + std::to_string(utils::percent(bytes, total)) + "%]";
    }
    return s;
}

void ProgressLine::update(const std::string& label, u64 bytes, u64 total) {
    if (tty_) {
        Logger::get().progress(format(label, bytes, total));
        return;
    }
    int step = utils::percent(bytes, total) / 10;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = last_step_.find(label);
        if (it != last_step_.end() && it->second >= step) return;
        last_step_[label] = step;
    }
    LOG_INFO(format(label, bytes, total));
}

void ProgressLine::single_block(const std::string& label, u64 total) {
    std::string msg = label + "  block size greater than total file size (" +
                      utils::format_bytes(total) + "), pulling entire file in one go";
    if (tty_) {
        Logger::get().progress(msg);
    } else {
        LOG_INFO(msg);
    }
}

void ProgressLine::finish(const std::string& label, u64 bytes, u64 total) {
    if (tty_) {
        Logger::get().progress(format(label, bytes, total));
        Logger::get().finish_progress();
    }
    std::lock_guard<std::mutex> lk(mutex_);
    last_step_.erase(label);
}
