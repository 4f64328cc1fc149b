/**
 * @file retry_policy.cpp
 * @brief Backoff curve.
 */
#include "galley/dispatch/retry_policy.hpp"

#include <algorithm>

namespace galley::dispatch {

std::chrono::milliseconds backoff_delay(const RetryPolicy& p, int attempt) noexcept {
    if (attempt <= 0) return std::chrono::milliseconds{0};

    double delay_ms = static_cast<double>(p.initial_backoff.count());
    const double cap = static_cast<double>(p.max_backoff.count());
    for (int i = 1; i < attempt && delay_ms < cap; ++i) {
        delay_ms *= p.multiplier;
    }
    const auto calculated = std::chrono::milliseconds{static_cast<std::int64_t>(std::min(delay_ms, cap))};
    return std::min(calculated, p.max_backoff);
}

std::string validate(const RetryPolicy& p) {
    if (p.max_attempts == 0)                          return "max_attempts must be at least 1";
    if (p.initial_backoff.count() < 0)                return "initial_backoff must not be negative";
    if (p.multiplier < 1.0)                           return "backoff_multiplier must be >= 1.0";
    if (p.max_backoff < p.initial_backoff)            return "max_backoff must be >= initial_backoff";
    if (p.attempt_timeout.count() <= 0)               return "attempt_timeout must be positive";
    if (p.connect_timeout.count() <= 0)               return "connect_timeout must be positive";
    return {};
}

} // namespace galley::dispatch
