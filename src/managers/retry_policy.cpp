#include "retry_policy.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

bool is_transient_errno(int err) {
    switch (err) {
        case EBUSY:
        case EAGAIN:
#if EWOULDBLOCK != EAGAIN
        case EWOULDBLOCK:
#endif
        case EINTR:
        case ETXTBSY:
        case ENOLCK:
        case EDEADLK:
        case ETIMEDOUT:
        case ECONNREFUSED:
        case ECONNRESET:
        case EHOSTUNREACH:
        case ENETUNREACH:
            return true;
        default:
            return false;
    }
}

AttemptResult attempt_from_errno(int err, const std::string& what) {
    std::string msg = fmt::format("{}: {}", what, std::strerror(err));
    return is_transient_errno(err) ? AttemptResult::Transient(msg) : AttemptResult::Permanent(msg);
}

Backoff::Backoff(const RetryPolicy& policy, unsigned seed)
    : policy_(policy), rng_(seed) {}

int Backoff::base_delay_ms(int retry) const {
    if (retry < 1) retry = 1;
    long long delay = policy_.base_backoff_ms;
    for (int i = 1; i < retry && delay < policy_.max_backoff_ms; ++i) {
        delay *= 2;
    }
    return static_cast<int>(std::min<long long>(delay, policy_.max_backoff_ms));
}

int Backoff::delay_ms(int retry) {
    int jitter = 0;
    if (policy_.jitter_max_ms > policy_.jitter_min_ms) {
        std::uniform_int_distribution<int> dist(policy_.jitter_min_ms, policy_.jitter_max_ms);
        std::lock_guard<std::mutex> lock(rng_mutex_);
        jitter = dist(rng_);
    } else {
        jitter = policy_.jitter_min_ms;
    }
    return base_delay_ms(retry) + jitter;
}
