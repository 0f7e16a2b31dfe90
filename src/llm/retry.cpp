#include "llm/retry.h"

#include <algorithm>
#include <cmath>

namespace tracescore::llm {

std::chrono::milliseconds RetryPolicy::BackoffBefore(int attempt) const {
    double factor = std::pow(multiplier, std::max(0, attempt - 2));
    double delay = static_cast<double>(initial_backoff.count()) * factor;
    delay = std::min(delay, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

}  // namespace tracescore::llm
