#pragma once

#include <atomic>
#include <mutex>
#include <string>

// Cooperative cancellation flag shared by the launcher, the running stage,
// the resource monitor and the SIGINT handler. The first reason sticks.
class AbortToken {
public:
    void request(const std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!requested_.load()) {
            reason_ = reason;
            requested_ = true;
        }
    }

    // Async-signal-safe: sets the flag only. reason() reports "interrupted".
    void request_from_signal() { signaled_ = true; }

    bool requested() const { return requested_.load() || signaled_.load(); }

    std::string reason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requested_.load()) return reason_;
        return signaled_.load() ? "interrupted by operator" : "";
    }

private:
    std::atomic<bool> requested_{false};
    std::atomic<bool> signaled_{false};
    mutable std::mutex mutex_;
    std::string reason_;
};
