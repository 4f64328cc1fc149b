#pragma once
/**
 * @file report.hpp
 * @brief Outcome records of a dispatch: per destination, alerts and notes.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "galley/print/print_bundle.hpp"
#include "galley/routing/station.hpp"

namespace galley::dispatch {

/** @enum DestinationStatus
 *  @brief Delivery state of one manifest entry.
 */
enum class DestinationStatus : std::uint8_t {
    Pending,       ///< First attempt not finished yet
    PendingRetry,  ///< Failed at least once, retry scheduled
    Delivered,     ///< Display published or printer acknowledged
    Failed,        ///< Retries exhausted (primary and backup)
    Cancelled,     ///< Stopped before it was written
    BuildFailed    ///< Ticket could not be rendered or encoded
};

const char* to_string(DestinationStatus s) noexcept;

/** @enum OverallStatus
 *  @brief Summary over all destinations of one send.
 */
enum class OverallStatus : std::uint8_t { Delivered, PartiallyDelivered, NotDelivered };

const char* to_string(OverallStatus s) noexcept;

struct DestinationResult {
    std::string          station_id;
    routing::StationKind kind{routing::StationKind::Display};
    DestinationStatus    status{DestinationStatus::Pending};
    std::string          delivered_via;   ///< Backup station id when failover delivered the job
    std::string          job_id;          ///< Printers only
    std::uint32_t        attempts{0};
    std::size_t          subscribers{0};  ///< Displays only: subscribers reached
    std::string          message;
};

struct DispatchReport {
    std::string                      order_id;
    std::vector<DestinationResult>   destinations;   ///< Manifest entry order
    std::vector<print::BuildFailure> build_failures;
    OverallStatus                    overall{OverallStatus::Delivered};

    [[nodiscard]] std::vector<std::string> succeeded() const;
    [[nodiscard]] std::vector<std::string> pending_retry() const;
    [[nodiscard]] std::vector<std::string> failed() const;
    [[nodiscard]] const DestinationResult* find(const std::string& station_id) const noexcept;
};

/// Recompute report.overall from the destinations.
void summarize(DispatchReport& report);

/** @struct OperatorAlert
 *  @brief Raised when a printer exhausts its retries.
 */
struct OperatorAlert {
    std::string                           order_id;
    std::string                           station_id;
    std::string                           job_id;
    std::string                           message;
    std::string                           failover_to;   ///< Backup being tried next (may be empty)
    std::chrono::system_clock::time_point raised_at{};
};

/** @struct OperationalNote
 *  @brief Informational record, e.g. a cancellation that could not be honoured.
 */
struct OperationalNote {
    std::string order_id;
    std::string station_id;
    std::string message;
};

/** @struct CancelResult
 *  @brief Outcome of cancel_order / cancel_items.
 */
struct CancelResult {
    std::vector<std::string>     cancelled_jobs;
    std::vector<std::string>     notified_displays;
    std::vector<OperationalNote> notes;
};

} // namespace galley::dispatch
