#include "../include/retry.hpp"
#include <chrono>
#include <cmath>
#include <thread>

int backoff_delay_ms(const RetryPolicy& policy, int attempt) {
    if (policy.initial_backoff_ms <= 0) return 0;
    double delay = policy.initial_backoff_ms * std::pow(std::max(1.0, policy.multiplier), std::max(0, attempt - 1));
    if (policy.max_backoff_ms > 0) delay = std::min(delay, (double)policy.max_backoff_ms);
    return (int)delay;
}

void sleep_with_cancel(int delay_ms, const CancellationToken* cancel, const std::string& where) {
    const int slice_ms = 50;
    int remaining = delay_ms;
    while (remaining > 0) {
        check_cancel(cancel, where);
        int step = std::min(slice_ms, remaining);
        std::this_thread::sleep_for(std::chrono::milliseconds(step));
        remaining -= step;
    }
    check_cancel(cancel, where);
}
