#pragma once
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <atomic>
#include <string>

struct RetryPolicy {
    int max_attempts{3};
    int initial_backoff_ms{500};
    double multiplier{2.0};
    int max_backoff_ms{8000};
};

class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }
    void throw_if_cancelled(const std::string& where) const {
        if (cancelled()) throw Cancelled("cancelled: " + where);
    }

private:
    std::atomic<bool> cancelled_{false};
};

inline void check_cancel(const CancellationToken* cancel, const std::string& where) {
    if (cancel) cancel->throw_if_cancelled(where);
}

// Delay before retry number `attempt` (1-based), capped at max_backoff_ms.
int backoff_delay_ms(const RetryPolicy& policy, int attempt);

// Sleeps in short slices so a cancelled request stops waiting early.
void sleep_with_cancel(int delay_ms, const CancellationToken* cancel, const std::string& where);

// Runs fn, retrying when it throws Transient. The last failure is rethrown.
template <typename Transient, typename Fn>
auto with_retry(const RetryPolicy& policy, const std::string& tag, const std::string& what, Fn&& fn,
                const CancellationToken* cancel = nullptr) -> decltype(fn()) {
    const int attempts = std::max(1, policy.max_attempts);
    for (int attempt = 1;; ++attempt) {
        check_cancel(cancel, what);
        try {
            return fn();
        } catch (const Transient& e) {
            if (attempt >= attempts) {
                log_error(tag, what + " failed after " + std::to_string(attempt) + " attempt(s): " + e.what());
                throw;
            }
            int delay = backoff_delay_ms(policy, attempt);
            log_warn(tag, what + " failed (attempt " + std::to_string(attempt) + "/" + std::to_string(attempts) +
                              "): " + e.what() + "; retrying in " + std::to_string(delay) + "ms");
            sleep_with_cancel(delay, cancel, what);
        }
    }
}
