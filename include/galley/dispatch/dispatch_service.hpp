#pragma once
/**
 * @file dispatch_service.hpp
 * @brief Fans a routing manifest out to displays and printers.
 *
 * Delivery semantics:
 *  - Display entries: published once to the station channel, best effort.
 *    Publishing never waits for a display to render.
 *  - Printer entries: one print job per entry, one std::jthread per job, each
 *    with its own attempt timeout, retry budget and stop token. Retries back
 *    off exponentially (RetryPolicy). Exhaustion raises an operator alert and,
 *    when a backup printer is configured, moves the job there with a fresh budget.
 *
 * The DispatchContext is created once at startup and passed by reference.
 * shutdown() drains in-flight jobs up to a deadline, then cancels the rest.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "galley/compat/expected.hpp"
#include "galley/config/constants.hpp"
#include "galley/dispatch/channel.hpp"
#include "galley/dispatch/print_job.hpp"
#include "galley/dispatch/printer_transport.hpp"
#include "galley/dispatch/report.hpp"
#include "galley/dispatch/retry_policy.hpp"
#include "galley/print/print_bundle.hpp"
#include "galley/routing/manifest.hpp"

namespace galley::obs { class Observer; }

namespace galley::dispatch {

/** @enum DispatchError
 *  @brief Total unavailability. Partial failures are reported, never returned.
 */
enum class DispatchError : std::uint8_t {
    ShuttingDown,   ///< shutdown() has been called
    NoTransport     ///< Printer tickets present but no PrinterTransport configured
};

const char* to_string(DispatchError e) noexcept;

/** @class OperatorAlertSink
 *  @brief Receives alerts meant for staff (POS banner, pager, ...).
 */
class OperatorAlertSink {
public:
    virtual ~OperatorAlertSink() = default;
    virtual void raise(const OperatorAlert& alert) = 0;
};

/** @class DispatchHandle
 *  @brief Live view of one dispatch. Copyable; all copies share the same state.
 */
class DispatchHandle final {
public:
    /// Current report; destinations still retrying show PendingRetry.
    [[nodiscard]] DispatchReport report() const;

    /// True once every destination is terminal.
    [[nodiscard]] bool done() const;

    /// Block until every destination is terminal and return the final report.
    DispatchReport wait() const;

    /// Bounded wait. Returns done().
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    friend class DispatchContext;
    struct Run;
    explicit DispatchHandle(std::shared_ptr<Run> run) : run_(std::move(run)) {}

    std::shared_ptr<Run> run_;
};

/** @class DispatchContext
 *  @brief Process-scoped dispatch service.
 */
class DispatchContext final {
public:
    /**
     * @param hub       Display channels (must outlive the context).
     * @param transport Printer client; may be null when no printers are configured.
     */
    DispatchContext(ChannelHub& hub, std::shared_ptr<PrinterTransport> transport, RetryPolicy policy = {},
                    RetentionPolicy retention = {});
    ~DispatchContext();

    DispatchContext(const DispatchContext&)            = delete;
    DispatchContext& operator=(const DispatchContext&) = delete;

    /// Install sinks before the first dispatch.
    void set_observer(obs::Observer* observer) noexcept { observer_ = observer; }
    void set_alert_sink(OperatorAlertSink* sink) noexcept { alert_sink_ = sink; }

    /// Start delivering @p manifest; returns immediately.
    galley_detail::expected<DispatchHandle, DispatchError>
    begin_dispatch(const routing::RoutingManifest& manifest, const print::PrintBundle& bundle);

    /// begin_dispatch() + wait().
    galley_detail::expected<DispatchReport, DispatchError>
    dispatch(const routing::RoutingManifest& manifest, const print::PrintBundle& bundle);

    /// Withdraw every job of @p order_id that has not been written to a printer yet.
    CancelResult cancel_order(const std::string& order_id);

    /// Withdraw jobs whose items are all in @p item_ids; displays get a cancel message.
    CancelResult cancel_items(const std::string& order_id, const std::vector<std::string>& item_ids);

    /// Stop accepting work, wait up to @p drain for in-flight jobs, cancel the remainder.
    void shutdown(std::chrono::milliseconds drain =
                      std::chrono::milliseconds{config::constants::DISPATCH_DRAIN_TIMEOUT_MS});

    [[nodiscard]] bool shutting_down() const noexcept { return shutting_down_.load(std::memory_order_acquire); }

    /// Copy of a job (in flight or finished) by id.
    [[nodiscard]] std::optional<PrintJob> job(const std::string& job_id) const;

    /// Copies of every job created for @p order_id, in creation order.
    [[nodiscard]] std::vector<PrintJob> jobs_for_order(const std::string& order_id) const;

    /**
     * @brief Forget finished jobs older than the retention window, then the oldest
     *        ones beyond max_jobs. Display deliveries follow the same rules.
     * @return Number of jobs evicted. Also runs at the start of every dispatch.
     */
    std::size_t prune();

    /// Jobs currently held (in flight and finished).
    [[nodiscard]] std::size_t retained_jobs() const;

    [[nodiscard]] const RetryPolicy& policy() const noexcept { return policy_; }
    [[nodiscard]] const RetentionPolicy& retention() const noexcept { return retention_; }

private:
    struct JobRecord;
    struct Worker;
    struct Target;

    /// Display station that received part of an order (for cancel notifications).
    struct DisplayDelivery {
        std::string              station_id;
        routing::OrderContext    order;
        std::vector<std::string> item_ids;
        std::chrono::steady_clock::time_point published_at{};
    };

    void run_job(JobRecord& rec, DispatchHandle::Run& run, std::size_t dest,
                 const print::PrintTicket& ticket);
    DispatchAttempt attempt_once(JobRecord& rec, const Target& target);
    void finish(JobRecord& rec, DispatchHandle::Run& run, std::size_t dest, JobState state,
                DestinationStatus status, std::string via, std::string message);
    void raise_alert(const OperatorAlert& alert);
    void publish_note(const OperationalNote& note);
    CancelResult cancel_matching(const std::string& order_id, const std::vector<std::string>* item_ids);
    void reap_finished();

    ChannelHub&                        hub_;
    std::shared_ptr<PrinterTransport>  transport_;
    RetryPolicy                        policy_;
    RetentionPolicy                    retention_;
    obs::Observer*                     observer_{nullptr};
    OperatorAlertSink*                 alert_sink_{nullptr};

    std::atomic<bool>                  shutting_down_{false};
    std::atomic<std::uint64_t>         job_seq_{0};
    std::atomic<std::uint64_t>         msg_seq_{0};

    mutable std::mutex                 mu_;        ///< jobs_, order_jobs_, displays_, workers_
    std::map<std::string, std::shared_ptr<JobRecord>>       jobs_;
    std::map<std::string, std::vector<std::string>>         order_jobs_;
    std::map<std::string, std::vector<DisplayDelivery>>     displays_;
    std::list<Worker>                  workers_;

    std::mutex                         done_mu_;   ///< active_
    std::condition_variable            done_cv_;
    std::size_t                        active_{0};
};

} // namespace galley::dispatch
