#pragma once
/**
 * @file print_job.hpp
 * @brief Print job state and the attempt log kept for every job.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "galley/print/escpos.hpp"

namespace galley::dispatch {

/** @enum JobState
 *  @brief Lifecycle of a print job.
 *  @note Pending -> Sent -> Acknowledged, or -> Failed / Cancelled.
 *        Once Sent, a job can no longer be cancelled.
 */
enum class JobState : std::uint8_t { Pending, Sent, Acknowledged, Failed, Cancelled };

const char* to_string(JobState s) noexcept;

[[nodiscard]] inline bool is_terminal(JobState s) noexcept {
    return s == JobState::Acknowledged || s == JobState::Failed || s == JobState::Cancelled;
}

/** @enum AttemptOutcome
 *  @brief Result of a single delivery attempt.
 */
enum class AttemptOutcome : std::uint8_t {
    Ok,
    Timeout,
    ConnectFailed,
    WriteFailed,
    PrinterOffline,
    Cancelled
};

const char* to_string(AttemptOutcome o) noexcept;

/** @struct DispatchAttempt
 *  @brief One try at delivering a job to one printer.
 */
struct DispatchAttempt {
    std::string                           station_id;   ///< Primary or backup printer
    std::chrono::system_clock::time_point started_at{};
    std::chrono::milliseconds             duration{0};
    AttemptOutcome                        outcome{AttemptOutcome::Ok};
    std::string                           message;
};

/** @struct PrintJob
 *  @brief Encoded ticket travelling to one printer station.
 */
struct PrintJob {
    std::string                           id;            ///< "<order id>/<station id>/<seq>"
    std::string                           order_id;
    std::string                           station_id;    ///< Station the entry was routed to
    std::string                           target_station_id; ///< Printer currently being tried
    std::vector<std::string>              item_ids;
    print::Bytes                          payload;
    std::chrono::system_clock::time_point created_at{};
    JobState                              state{JobState::Pending};
    std::uint32_t                         attempts{0};
    std::vector<DispatchAttempt>          log;
};

} // namespace galley::dispatch
