#pragma once

/// @file retry.h
/// @brief Bounded exponential backoff for provider calls

#include <chrono>
#include <functional>
#include <thread>

#include <absl/status/statusor.h>

#include "common/error.h"
#include "common/logging.h"

namespace tracescore::llm {

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{500};
    std::chrono::milliseconds max_backoff{8000};
    double multiplier = 2.0;

    /// @brief Backoff before attempt number `attempt` (1-based, attempt >= 2)
    std::chrono::milliseconds BackoffBefore(int attempt) const;
};

/// @brief Call fn until it succeeds, fails permanently, attempts run out or
/// the deadline is reached
///
/// Only IsTransient() failures are retried. No retry is started when its
/// backoff would end at or past the deadline, so a call never outlives its
/// caller's budget by more than one attempt. The last failure is returned
/// unchanged.
template <typename T>
absl::StatusOr<T> CallWithRetry(const RetryPolicy& policy,
                                std::chrono::steady_clock::time_point deadline,
                                const std::function<absl::StatusOr<T>()>& fn,
                                const std::function<void(std::chrono::milliseconds)>& sleep =
                                    [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {
    absl::StatusOr<T> result = fn();
    for (int attempt = 2; attempt <= policy.max_attempts; ++attempt) {
        if (result.ok() || !IsTransient(result.status())) {
            return result;
        }
        auto backoff = policy.BackoffBefore(attempt);
        if (deadline != std::chrono::steady_clock::time_point::max()) {
            auto remaining = deadline - std::chrono::steady_clock::now();
            if (remaining <= backoff) {
                TRACESCORE_LOG_DEBUG("Not retrying, {}ms backoff exceeds the deadline (attempt {}/{}): {}",
                                     backoff.count(), attempt, policy.max_attempts,
                                     result.status().ToString());
                return result;
            }
        }
        TRACESCORE_LOG_DEBUG("Retrying in {}ms (attempt {}/{}): {}", backoff.count(), attempt,
                             policy.max_attempts, result.status().ToString());
        sleep(backoff);
        result = fn();
    }
    return result;
}

}  // namespace tracescore::llm
