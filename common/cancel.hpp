#pragma once

// ============================================================
// cancel.hpp -- Run-wide cancellation (signal or deadline)
// ============================================================

#include <atomic>
#include <chrono>

class CancelToken {
public:
    CancelToken() = default;

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    // Async-signal-safe
    void cancel() { stop_.store(true); }

    // Cancel automatically once `seconds` have elapsed (0 = never)
    void set_timeout(int seconds) {
        if (seconds <= 0) {
            deadline_ns_.store(0);
            return;
        }
        auto dl = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
        deadline_ns_.store(dl.time_since_epoch().count());
    }

    bool cancelled() const {
        if (stop_.load()) return true;
        auto dl = deadline_ns_.load();
        if (dl != 0 &&
            std::chrono::steady_clock::now().time_since_epoch().count() >= dl) {
            return true;
        }
        return false;
    }

    bool timed_out() const {
        auto dl = deadline_ns_.load();
        return !stop_.load() && dl != 0 &&
               std::chrono::steady_clock::now().time_since_epoch().count() >= dl;
    }

private:
    std::atomic<bool> stop_{false};
    std::atomic<std::chrono::steady_clock::rep> deadline_ns_{0};
};
