#pragma once
/**
 * @file retry_policy.hpp
 * @brief Bounded exponential backoff for print jobs, and how long finished jobs are kept.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "galley/config/constants.hpp"

namespace galley::dispatch {

/** @struct RetryPolicy
 *  @brief Retry ceiling, backoff curve and per-attempt timeouts.
 */
struct RetryPolicy {
    std::uint32_t             max_attempts{config::constants::DISPATCH_MAX_ATTEMPTS};
    std::chrono::milliseconds initial_backoff{config::constants::DISPATCH_INITIAL_BACKOFF_MS};
    double                    multiplier{config::constants::DISPATCH_BACKOFF_MULTIPLIER};
    std::chrono::milliseconds max_backoff{config::constants::DISPATCH_MAX_BACKOFF_MS};
    std::chrono::milliseconds attempt_timeout{config::constants::DISPATCH_ATTEMPT_TIMEOUT_MS};
    std::chrono::milliseconds connect_timeout{config::constants::DISPATCH_CONNECT_TIMEOUT_MS};
    bool                      require_status_ack{config::constants::DISPATCH_REQUIRE_STATUS_ACK};

    bool operator==(const RetryPolicy&) const = default;
};

/** @struct RetentionPolicy
 *  @brief How long finished jobs and display deliveries stay queryable.
 *  @note Jobs still in flight are never evicted.
 */
struct RetentionPolicy {
    std::chrono::milliseconds window{config::constants::DISPATCH_JOB_RETENTION_MS};
    std::size_t               max_jobs{config::constants::DISPATCH_MAX_RETAINED_JOBS};

    bool operator==(const RetentionPolicy&) const = default;
};

/**
 * @brief Delay to wait after failed attempt number @p attempt (1-based).
 * @return initial_backoff * multiplier^(attempt-1), capped at max_backoff; zero for attempt <= 0.
 */
std::chrono::milliseconds backoff_delay(const RetryPolicy& p, int attempt) noexcept;

/// Empty string when usable, otherwise the first problem.
std::string validate(const RetryPolicy& p);

} // namespace galley::dispatch
