/**
 * @file report.cpp
 * @brief Status names and report summaries.
 */
#include "galley/dispatch/print_job.hpp"
#include "galley/dispatch/report.hpp"

namespace galley::dispatch {

const char* to_string(JobState s) noexcept {
    switch (s) {
        case JobState::Pending:      return "pending";
        case JobState::Sent:         return "sent";
        case JobState::Acknowledged: return "acknowledged";
        case JobState::Failed:       return "failed";
        case JobState::Cancelled:    return "cancelled";
    }
    return "unknown";
}

const char* to_string(AttemptOutcome o) noexcept {
    switch (o) {
        case AttemptOutcome::Ok:             return "ok";
        case AttemptOutcome::Timeout:        return "timeout";
        case AttemptOutcome::ConnectFailed:  return "connect_failed";
        case AttemptOutcome::WriteFailed:    return "write_failed";
        case AttemptOutcome::PrinterOffline: return "printer_offline";
        case AttemptOutcome::Cancelled:      return "cancelled";
    }
    return "unknown";
}

const char* to_string(DestinationStatus s) noexcept {
    switch (s) {
        case DestinationStatus::Pending:      return "pending";
        case DestinationStatus::PendingRetry: return "pending_retry";
        case DestinationStatus::Delivered:    return "delivered";
        case DestinationStatus::Failed:       return "failed";
        case DestinationStatus::Cancelled:    return "cancelled";
        case DestinationStatus::BuildFailed:  return "build_failed";
    }
    return "unknown";
}

const char* to_string(OverallStatus s) noexcept {
    switch (s) {
        case OverallStatus::Delivered:          return "delivered";
        case OverallStatus::PartiallyDelivered: return "partially_delivered";
        case OverallStatus::NotDelivered:       return "not_delivered";
    }
    return "unknown";
}

namespace {

std::vector<std::string> ids_with(const DispatchReport& r, DestinationStatus s) {
    std::vector<std::string> out;
    for (const auto& d : r.destinations) {
        if (d.status == s) out.push_back(d.station_id);
    }
    return out;
}

} // namespace

std::vector<std::string> DispatchReport::succeeded() const {
    return ids_with(*this, DestinationStatus::Delivered);
}

std::vector<std::string> DispatchReport::pending_retry() const {
    return ids_with(*this, DestinationStatus::PendingRetry);
}

std::vector<std::string> DispatchReport::failed() const {
    auto out = ids_with(*this, DestinationStatus::Failed);
    auto bf  = ids_with(*this, DestinationStatus::BuildFailed);
    out.insert(out.end(), bf.begin(), bf.end());
    return out;
}

const DestinationResult* DispatchReport::find(const std::string& station_id) const noexcept {
    for (const auto& d : destinations) {
        if (d.station_id == station_id) return &d;
    }
    return nullptr;
}

void summarize(DispatchReport& report) {
    std::size_t delivered = 0;
    std::size_t counted   = 0;
    for (const auto& d : report.destinations) {
        if (d.status == DestinationStatus::Cancelled) continue;
        ++counted;
        if (d.status == DestinationStatus::Delivered) ++delivered;
    }
    if (delivered == counted) {
        report.overall = OverallStatus::Delivered;
    } else if (delivered == 0) {
        report.overall = OverallStatus::NotDelivered;
    } else {
        report.overall = OverallStatus::PartiallyDelivered;
    }
}

} // namespace galley::dispatch
