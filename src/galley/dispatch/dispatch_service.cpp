/**
 * @file dispatch_service.cpp
 * @brief Per-destination delivery tasks, retry/backoff, failover and cancellation.
 */
#include "galley/dispatch/dispatch_service.hpp"
#include "galley/obs/logger.hpp"
#include "galley/obs/observability.hpp"

#include <algorithm>
#include <cstddef>
#include <set>
#include <stop_token>
#include <thread>

namespace galley::dispatch {

using obs::logger;

const char* to_string(DispatchError e) noexcept {
    switch (e) {
        case DispatchError::ShuttingDown: return "shutting_down";
        case DispatchError::NoTransport:  return "no_transport";
    }
    return "unknown";
}

//------------------------------- Internal state --------------------------------

struct DispatchHandle::Run {
    mutable std::mutex              mu;
    mutable std::condition_variable cv;
    DispatchReport                  report;
    std::size_t                     pending{0};
};

struct DispatchContext::JobRecord {
    mutable std::mutex mu;
    PrintJob           job;
    bool               written{false};   ///< Bytes have been handed to a printer at least once
    std::stop_source   stop;
    std::chrono::steady_clock::time_point finished_at{};   ///< Set with the terminal state
};

struct DispatchContext::Worker {
    std::jthread                       thread;
    std::shared_ptr<std::atomic<bool>> done;
};

struct DispatchContext::Target {
    std::string             station_id;
    routing::PrinterAddress address;
    const print::Bytes*     payload{nullptr};
};

namespace {

AttemptOutcome outcome_of(TransportError e) noexcept {
    switch (e) {
        case TransportError::ResolveFailed:
        case TransportError::ConnectFailed:  return AttemptOutcome::ConnectFailed;
        case TransportError::Timeout:        return AttemptOutcome::Timeout;
        case TransportError::WriteFailed:    return AttemptOutcome::WriteFailed;
        case TransportError::PrinterOffline: return AttemptOutcome::PrinterOffline;
    }
    return AttemptOutcome::WriteFailed;
}

/// Sleep for @p d unless @p st is stopped first. Returns false when stopped.
bool sleep_unless_stopped(std::chrono::milliseconds d, std::stop_token st) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lk(m);
    cv.wait_for(lk, st, d, [] { return false; });
    return !st.stop_requested();
}

std::string hex_byte(std::uint8_t b) {
    static constexpr char digits[] = "0123456789abcdef";
    return std::string{"0x"} + digits[b >> 4] + digits[b & 0x0F];
}

} // namespace

//------------------------------- DispatchHandle --------------------------------

DispatchReport DispatchHandle::report() const {
    std::lock_guard<std::mutex> lk(run_->mu);
    return run_->report;
}

bool DispatchHandle::done() const {
    std::lock_guard<std::mutex> lk(run_->mu);
    return run_->pending == 0;
}

DispatchReport DispatchHandle::wait() const {
    std::unique_lock<std::mutex> lk(run_->mu);
    run_->cv.wait(lk, [&] { return run_->pending == 0; });
    return run_->report;
}

bool DispatchHandle::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(run_->mu);
    return run_->cv.wait_for(lk, timeout, [&] { return run_->pending == 0; });
}

//------------------------------ DispatchContext --------------------------------

DispatchContext::DispatchContext(ChannelHub& hub, std::shared_ptr<PrinterTransport> transport, RetryPolicy policy,
                                 RetentionPolicy retention)
    : hub_(hub), transport_(std::move(transport)), policy_(policy), retention_(retention) {
    if (policy_.max_attempts == 0) policy_.max_attempts = 1;
}

DispatchContext::~DispatchContext() {
    shutdown(std::chrono::milliseconds{0});
}

galley_detail::expected<DispatchReport, DispatchError>
DispatchContext::dispatch(const routing::RoutingManifest& manifest, const print::PrintBundle& bundle) {
    auto h = begin_dispatch(manifest, bundle);
    if (!h) return galley_detail::unexpected(h.error());
    return h->wait();
}

galley_detail::expected<DispatchHandle, DispatchError>
DispatchContext::begin_dispatch(const routing::RoutingManifest& manifest, const print::PrintBundle& bundle) {
    if (shutting_down()) return galley_detail::unexpected(DispatchError::ShuttingDown);

    // Printer entries that have a ticket to send.
    std::vector<std::pair<std::size_t, const print::PrintTicket*>> planned;
    auto run = std::make_shared<DispatchHandle::Run>();
    DispatchReport& report = run->report;
    report.order_id       = manifest.order.order_id;
    report.build_failures = bundle.failures;

    // Display entries are published only once the dispatch is known to go ahead.
    std::vector<std::size_t> display_dests;
    for (const auto& e : manifest.entries) {
        DestinationResult d;
        d.station_id = e.station_id;
        d.kind       = e.kind;

        if (e.kind == routing::StationKind::Display) {
            display_dests.push_back(report.destinations.size());
        } else if (const print::PrintTicket* t = bundle.find(e.station_id)) {
            d.status = DestinationStatus::Pending;
            planned.emplace_back(report.destinations.size(), t);
        } else {
            d.status  = DestinationStatus::BuildFailed;
            d.message = "no ticket built";
            for (const auto& f : bundle.failures) {
                if (f.station_id == e.station_id) { d.message = f.reason; break; }
            }
        }
        report.destinations.push_back(std::move(d));
    }

    if (!planned.empty() && !transport_) {
        logger()->error("dispatch: order '{}' has {} printer ticket(s) but no printer transport",
                        manifest.order.order_id, planned.size());
        return galley_detail::unexpected(DispatchError::NoTransport);
    }

    reap_finished();
    prune();
    run->pending = planned.size();

    {
        std::lock_guard<std::mutex> lk(mu_);
        if (shutting_down()) return galley_detail::unexpected(DispatchError::ShuttingDown);

        std::vector<DisplayDelivery> delivered;
        for (const std::size_t dest : display_dests) {
            const routing::RoutingManifestEntry& e = manifest.entries[dest];
            auto msg = std::make_shared<ChannelMessage>();
            msg->kind       = ChannelMessage::Kind::Entry;
            msg->sequence   = ++msg_seq_;
            msg->station_id = e.station_id;
            msg->order      = manifest.order;
            msg->entry      = e;
            const PublishResult pr = hub_.publish(std::move(msg));

            DestinationResult& d = report.destinations[dest];
            d.status      = DestinationStatus::Delivered;
            d.subscribers = pr.delivered;
            if (pr.delivered == 0 && pr.dropped == 0) {
                d.message = "no subscribers connected";
                logger()->warn("dispatch: order '{}' published to '{}' with no subscribers",
                               manifest.order.order_id, e.station_id);
            } else if (pr.dropped > 0) {
                d.message = std::to_string(pr.dropped) + " subscriber(s) missed the update and need a refresh";
            }

            DisplayDelivery dd{e.station_id, manifest.order, {}, std::chrono::steady_clock::now()};
            for (const auto& item : e.items) dd.item_ids.push_back(item->id);
            delivered.push_back(std::move(dd));
        }
        if (!delivered.empty()) {
            auto& disp = displays_[manifest.order.order_id];
            disp.insert(disp.end(), delivered.begin(), delivered.end());
        }
        if (planned.empty()) summarize(report);

        // Register every job before the first worker starts touching the report.
        const auto now = std::chrono::system_clock::now();
        std::vector<std::shared_ptr<JobRecord>> recs;
        recs.reserve(planned.size());
        for (const auto& [dest, ticket] : planned) {
            auto rec = std::make_shared<JobRecord>();
            PrintJob& job = rec->job;
            job.id                = manifest.order.order_id + "/" + ticket->station_id + "/" +
                                    std::to_string(++job_seq_);
            job.order_id          = manifest.order.order_id;
            job.station_id        = ticket->station_id;
            job.target_station_id = ticket->station_id;
            job.payload           = ticket->payload;
            job.created_at        = now;
            if (const auto* entry = manifest.entry_for(ticket->station_id)) {
                for (const auto& item : entry->items) job.item_ids.push_back(item->id);
            }
            report.destinations[dest].job_id = job.id;

            jobs_.emplace(job.id, rec);
            order_jobs_[job.order_id].push_back(job.id);
            recs.push_back(std::move(rec));
        }

        {
            std::lock_guard<std::mutex> dk(done_mu_);
            active_ += planned.size();
        }
        for (std::size_t i = 0; i < planned.size(); ++i) {
            auto rec  = recs[i];
            auto copy = std::make_shared<const print::PrintTicket>(*planned[i].second);
            auto done = std::make_shared<std::atomic<bool>>(false);
            Worker w;
            w.done   = done;
            w.thread = std::jthread([this, rec, run, dest = planned[i].first, copy, done] {
                run_job(*rec, *run, dest, *copy);
                done->store(true, std::memory_order_release);
                {
                    std::lock_guard<std::mutex> dk(done_mu_);
                    --active_;
                }
                done_cv_.notify_all();
            });
            workers_.push_back(std::move(w));
        }
    }

    logger()->debug("dispatch: order '{}' -> {} destination(s), {} print job(s)",
                    manifest.order.order_id, manifest.entries.size(), planned.size());

    if (planned.empty() && observer_) {
        observer_->on_dispatch(run->report);
    }
    return DispatchHandle(run);
}

void DispatchContext::run_job(JobRecord& rec, DispatchHandle::Run& run, std::size_t dest,
                              const print::PrintTicket& ticket) {
    const std::stop_token stop = rec.stop.get_token();

    std::vector<Target> targets;
    targets.push_back({ticket.station_id, ticket.address, &ticket.payload});
    if (ticket.backup_payload) {
        targets.push_back({ticket.backup_station_id, ticket.backup_address, &*ticket.backup_payload});
    }

    std::string last_message;
    for (std::size_t ti = 0; ti < targets.size(); ++ti) {
        const Target& target = targets[ti];
        std::string order_id;
        std::string job_id;
        {
            std::lock_guard<std::mutex> lk(rec.mu);
            rec.job.target_station_id = target.station_id;
            rec.job.payload           = *target.payload;
            order_id = rec.job.order_id;
            job_id   = rec.job.id;
        }

        for (std::uint32_t attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
            DispatchAttempt a = attempt_once(rec, target);
            last_message = a.message;
            std::uint32_t total = 0;
            {
                std::lock_guard<std::mutex> lk(rec.mu);
                rec.job.attempts++;
                total = rec.job.attempts;
                rec.job.log.push_back(a);
            }
            {
                std::lock_guard<std::mutex> lk(run.mu);
                run.report.destinations[dest].attempts = total;
            }

            if (a.outcome == AttemptOutcome::Ok) {
                finish(rec, run, dest, JobState::Acknowledged, DestinationStatus::Delivered,
                       ti > 0 ? target.station_id : std::string{},
                       ti > 0 ? "delivered via backup '" + target.station_id + "'" : std::string{});
                return;
            }
            if (a.outcome == AttemptOutcome::Cancelled) {
                finish(rec, run, dest, JobState::Cancelled, DestinationStatus::Cancelled, {}, a.message);
                return;
            }

            if (attempt < policy_.max_attempts) {
                const auto delay = backoff_delay(policy_, static_cast<int>(attempt));
                logger()->warn("dispatch: job '{}' to '{}' attempt {}/{} failed ({}: {}), retry in {} ms",
                               job_id, target.station_id, attempt, policy_.max_attempts,
                               to_string(a.outcome), a.message, delay.count());
                {
                    std::lock_guard<std::mutex> lk(run.mu);
                    auto& d = run.report.destinations[dest];
                    d.status  = DestinationStatus::PendingRetry;
                    d.message = a.message;
                }
                if (!sleep_unless_stopped(delay, stop)) {
                    finish(rec, run, dest, JobState::Cancelled, DestinationStatus::Cancelled, {},
                           "cancelled while waiting to retry");
                    return;
                }
            }
        }

        OperatorAlert alert;
        alert.order_id    = order_id;
        alert.station_id  = target.station_id;
        alert.job_id      = job_id;
        alert.message     = "printer '" + target.station_id + "' failed after " +
                            std::to_string(policy_.max_attempts) + " attempt(s): " + last_message;
        alert.failover_to = (ti + 1 < targets.size()) ? targets[ti + 1].station_id : std::string{};
        alert.raised_at   = std::chrono::system_clock::now();
        raise_alert(alert);
    }

    finish(rec, run, dest, JobState::Failed, DestinationStatus::Failed, {}, last_message);
}

DispatchAttempt DispatchContext::attempt_once(JobRecord& rec, const Target& target) {
    using Steady = std::chrono::steady_clock;
    const std::stop_token stop = rec.stop.get_token();

    DispatchAttempt a;
    a.station_id = target.station_id;
    a.started_at = std::chrono::system_clock::now();
    const auto t0 = Steady::now();
    const auto result = [&](AttemptOutcome o, std::string msg) {
        a.outcome  = o;
        a.message  = std::move(msg);
        a.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Steady::now() - t0);
        return a;
    };

    if (stop.stop_requested()) return result(AttemptOutcome::Cancelled, "cancelled before connect");

    auto conn = transport_->connect(target.address, policy_.connect_timeout);
    if (!conn) {
        return result(outcome_of(conn.error()),
                      std::string{"connect "} + target.address.host + ":" +
                      std::to_string(target.address.port) + ": " + to_string(conn.error()));
    }

    if (policy_.require_status_ack) {
        auto st = (*conn)->query_status(policy_.attempt_timeout);
        if (!st) return result(outcome_of(st.error()), std::string{"status query: "} + to_string(st.error()));
        if (!print::status_online(*st)) {
            return result(AttemptOutcome::PrinterOffline, "printer reports offline (status " + hex_byte(*st) + ")");
        }
    }

    {
        // Past this point the ticket may be on paper; cancellation can no longer retract it.
        std::lock_guard<std::mutex> lk(rec.mu);
        if (stop.stop_requested()) return result(AttemptOutcome::Cancelled, "cancelled before write");
        rec.written = true;
    }

    if (auto w = (*conn)->write(*target.payload, policy_.attempt_timeout); !w) {
        return result(outcome_of(w.error()), std::string{"write: "} + to_string(w.error()));
    }
    {
        std::lock_guard<std::mutex> lk(rec.mu);
        rec.job.state = JobState::Sent;
    }

    if (policy_.require_status_ack) {
        auto st = (*conn)->query_status(policy_.attempt_timeout);
        if (!st) {
            const auto o = st.error() == TransportError::Timeout ? AttemptOutcome::Timeout : outcome_of(st.error());
            return result(o, std::string{"no acknowledgment: "} + to_string(st.error()));
        }
        if (!print::status_online(*st)) {
            return result(AttemptOutcome::PrinterOffline, "printer went offline after write (status " + hex_byte(*st) + ")");
        }
    }
    return result(AttemptOutcome::Ok, "acknowledged");
}

void DispatchContext::finish(JobRecord& rec, DispatchHandle::Run& run, std::size_t dest, JobState state,
                             DestinationStatus status, std::string via, std::string message) {
    std::string job_id;
    {
        std::lock_guard<std::mutex> lk(rec.mu);
        rec.job.state   = state;
        rec.finished_at = std::chrono::steady_clock::now();
        job_id = rec.job.id;
    }

    std::optional<DispatchReport> final_report;
    {
        std::lock_guard<std::mutex> lk(run.mu);
        auto& d = run.report.destinations[dest];
        d.status        = status;
        d.delivered_via = std::move(via);
        d.message       = std::move(message);
        if (--run.pending == 0) {
            summarize(run.report);
            final_report = run.report;
        }
    }
    run.cv.notify_all();

    if (status == DestinationStatus::Failed) {
        logger()->error("dispatch: job '{}' failed", job_id);
    } else {
        logger()->debug("dispatch: job '{}' {}", job_id, to_string(state));
    }
    if (final_report && observer_) observer_->on_dispatch(*final_report);
}

void DispatchContext::raise_alert(const OperatorAlert& alert) {
    logger()->error("dispatch: ALERT order '{}' station '{}': {}{}", alert.order_id, alert.station_id,
                    alert.message, alert.failover_to.empty() ? "" : " (failing over to '" + alert.failover_to + "')");
    if (alert_sink_) alert_sink_->raise(alert);
    if (observer_) observer_->on_alert(alert);
}

void DispatchContext::publish_note(const OperationalNote& note) {
    logger()->info("dispatch: note order '{}' station '{}': {}", note.order_id, note.station_id, note.message);
    if (observer_) observer_->on_note(note);
}

CancelResult DispatchContext::cancel_order(const std::string& order_id) {
    return cancel_matching(order_id, nullptr);
}

CancelResult DispatchContext::cancel_items(const std::string& order_id, const std::vector<std::string>& item_ids) {
    return cancel_matching(order_id, &item_ids);
}

CancelResult DispatchContext::cancel_matching(const std::string& order_id, const std::vector<std::string>* item_ids) {
    CancelResult r;
    std::set<std::string> removed;
    if (item_ids) removed.insert(item_ids->begin(), item_ids->end());

    std::vector<std::shared_ptr<JobRecord>> recs;
    std::vector<DisplayDelivery> displays;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (const auto it = order_jobs_.find(order_id); it != order_jobs_.end()) {
            for (const auto& id : it->second) recs.push_back(jobs_.at(id));
        }
        if (const auto it = displays_.find(order_id); it != displays_.end()) displays = it->second;
    }

    for (const auto& rec : recs) {
        std::lock_guard<std::mutex> lk(rec->mu);
        const PrintJob& job = rec->job;

        if (item_ids) {
            const auto in_removed = [&](const std::string& id) { return removed.count(id) != 0; };
            const bool all  = std::all_of(job.item_ids.begin(), job.item_ids.end(), in_removed);
            const bool some = std::any_of(job.item_ids.begin(), job.item_ids.end(), in_removed);
            if (!some) continue;
            if (!all) {
                r.notes.push_back({order_id, job.station_id,
                                   "ticket also carries items that were not cancelled; not withdrawn"});
                continue;
            }
        }

        if (job.state == JobState::Cancelled || job.state == JobState::Failed) continue;
        if (rec->written || is_terminal(job.state)) {
            r.notes.push_back({order_id, job.target_station_id,
                               std::string{"ticket already sent to printer ("} + to_string(job.state) +
                               "); it cannot be retracted"});
            continue;
        }
        rec->stop.request_stop();
        r.cancelled_jobs.push_back(job.id);
    }

    for (const auto& d : displays) {
        auto msg = std::make_shared<ChannelMessage>();
        msg->kind       = ChannelMessage::Kind::Cancel;
        msg->sequence   = ++msg_seq_;
        msg->station_id = d.station_id;
        msg->order      = d.order;
        if (item_ids) {
            for (const auto& id : d.item_ids) {
                if (removed.count(id)) msg->cancelled_item_ids.push_back(id);
            }
            if (msg->cancelled_item_ids.empty()) continue;
        }
        hub_.publish(std::move(msg));
        r.notified_displays.push_back(d.station_id);
    }

    for (const auto& n : r.notes) publish_note(n);
    logger()->info("dispatch: cancel order '{}': {} job(s) withdrawn, {} display(s) notified, {} note(s)",
                   order_id, r.cancelled_jobs.size(), r.notified_displays.size(), r.notes.size());
    return r;
}

void DispatchContext::reap_finished() {
    std::list<Worker> finished;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done->load(std::memory_order_acquire)) {
                auto next = std::next(it);
                finished.splice(finished.end(), workers_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    // jthread destructors join outside the lock.
}

std::size_t DispatchContext::prune() {
    using Steady = std::chrono::steady_clock;
    const auto now = Steady::now();

    struct Finished {
        Steady::time_point at;
        std::string        id;
        std::string        order_id;
    };

    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Finished> finished;
    for (const auto& [id, rec] : jobs_) {
        std::lock_guard<std::mutex> rk(rec->mu);
        if (is_terminal(rec->job.state)) finished.push_back({rec->finished_at, id, rec->job.order_id});
    }
    std::sort(finished.begin(), finished.end(),
              [](const Finished& a, const Finished& b) { return a.at < b.at; });

    // Oldest first: everything beyond the count limit, then whatever has aged out.
    const std::size_t over = finished.size() > retention_.max_jobs ? finished.size() - retention_.max_jobs : 0;
    std::size_t evicted = 0;
    for (const auto& f : finished) {
        if (evicted >= over && now - f.at < retention_.window) break;
        jobs_.erase(f.id);
        if (const auto it = order_jobs_.find(f.order_id); it != order_jobs_.end()) {
            auto& ids = it->second;
            ids.erase(std::remove(ids.begin(), ids.end(), f.id), ids.end());
            if (ids.empty()) order_jobs_.erase(it);
        }
        ++evicted;
    }

    std::vector<Steady::time_point> published;
    for (const auto& [order_id, list] : displays_) {
        for (const auto& d : list) published.push_back(d.published_at);
    }
    Steady::time_point cutoff = now - retention_.window;
    if (published.size() > retention_.max_jobs) {
        const auto nth = published.begin() + static_cast<std::ptrdiff_t>(published.size() - retention_.max_jobs - 1);
        std::nth_element(published.begin(), nth, published.end());
        cutoff = std::max(cutoff, *nth + Steady::duration{1});
    }
    for (auto it = displays_.begin(); it != displays_.end();) {
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [&](const DisplayDelivery& d) { return d.published_at < cutoff; }),
                   list.end());
        it = list.empty() ? displays_.erase(it) : std::next(it);
    }

    if (evicted > 0) logger()->debug("dispatch: evicted {} finished job(s)", evicted);
    return evicted;
}

std::size_t DispatchContext::retained_jobs() const {
    std::lock_guard<std::mutex> lk(mu_);
    return jobs_.size();
}

void DispatchContext::shutdown(std::chrono::milliseconds drain) {
    const bool first = !shutting_down_.exchange(true, std::memory_order_acq_rel);

    {
        std::unique_lock<std::mutex> lk(done_mu_);
        const bool drained = done_cv_.wait_for(lk, drain, [&] { return active_ == 0; });
        if (first && !drained) {
            logger()->warn("dispatch: drain window of {} ms elapsed with {} job(s) in flight, cancelling",
                           drain.count(), active_);
        }
    }

    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& [id, rec] : jobs_) rec->stop.request_stop();
        workers.swap(workers_);
    }
    workers.clear(); // joins
    if (first) logger()->info("dispatch: shut down");
}

std::optional<PrintJob> DispatchContext::job(const std::string& job_id) const {
    std::shared_ptr<JobRecord> rec;
    {
        std::lock_guard<std::mutex> lk(mu_);
        const auto it = jobs_.find(job_id);
        if (it == jobs_.end()) return std::nullopt;
        rec = it->second;
    }
    std::lock_guard<std::mutex> lk(rec->mu);
    return rec->job;
}

std::vector<PrintJob> DispatchContext::jobs_for_order(const std::string& order_id) const {
    std::vector<std::shared_ptr<JobRecord>> recs;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (const auto it = order_jobs_.find(order_id); it != order_jobs_.end()) {
            for (const auto& id : it->second) recs.push_back(jobs_.at(id));
        }
    }
    std::vector<PrintJob> out;
    out.reserve(recs.size());
    for (const auto& rec : recs) {
        std::lock_guard<std::mutex> lk(rec->mu);
        out.push_back(rec->job);
    }
    return out;
}

} // namespace galley::dispatch
