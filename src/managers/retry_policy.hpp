#pragma once

#include <string>
#include <random>
#include <mutex>
#include <core/types.hpp>

// Outcome of one copy or notification attempt.
struct AttemptResult {
    bool ok = false;
    bool transient = false;         // worth retrying
    std::string error;

    static AttemptResult Ok() { return {true, false, ""}; }
    static AttemptResult Transient(const std::string& e) { return {false, true, e}; }
    static AttemptResult Permanent(const std::string& e) { return {false, false, e}; }
};

// I/O contention and lock conflicts are transient; missing sources,
// permission problems, read-only or full volumes and bad paths are not.
bool is_transient_errno(int err);

// Build an AttemptResult from an errno value and a context message.
AttemptResult attempt_from_errno(int err, const std::string& what);

// delay = min(max_backoff, base * 2^(retry-1)) + uniform(jitter_min, jitter_max)
// retry counts from 1.
class Backoff {
public:
    explicit Backoff(const RetryPolicy& policy, unsigned seed = std::random_device{}());

    int delay_ms(int retry);
    int base_delay_ms(int retry) const;

    const RetryPolicy& policy() const { return policy_; }

private:
    RetryPolicy policy_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};
