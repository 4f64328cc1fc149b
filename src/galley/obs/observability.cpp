/**
 * @file observability.cpp
 * @brief spdlog-backed Observer.
 */
#include "galley/obs/observability.hpp"
#include "galley/obs/logger.hpp"

#include <cstdio>
#include <mutex>
#include <string>

namespace galley::obs {

    std::string json_escape(std::string_view in) {
        std::string out;
        out.reserve(in.size());
        for (const char c : in) {
            switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof buf, "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
            }
        }
        return out;
    }

    namespace {

    std::string json_list(const std::vector<std::string>& v) {
        std::string out = "[";
        for (std::size_t i = 0; i < v.size(); ++i) {
            if (i) out += ',';
            out += '"';
            out += json_escape(v[i]);
            out += '"';
        }
        out += ']';
        return out;
    }

    } // namespace

    class LogObserver : public Observer {
    public:
        void on_manifest(const routing::RoutingManifest& m) override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                ctr_.manifests++;
                ctr_.items_routed    += m.stats.routed;
                ctr_.items_unrouted  += m.stats.unrouted;
                ctr_.tag_diagnostics += m.diagnostics.size();
            }
            std::vector<std::string> stations;
            for (const auto& e : m.entries) stations.push_back(e.station_id);
            logger()->info(
                R"({{"event":"manifest","order":"{}","registry_version":{},"total":{},"routed":{},"unrouted":{},"skipped_sent":{},"stations":{}}})",
                json_escape(m.order.order_id), m.registry_version, m.stats.total, m.stats.routed,
                m.stats.unrouted, m.stats.skipped_sent, json_list(stations));

            for (const auto& u : m.unrouted) {
                logger()->warn(R"({{"event":"unrouted","order":"{}","item":"{}","name":"{}","reason":"{}"}})",
                               json_escape(m.order.order_id), json_escape(u.item->id),
                               json_escape(u.item->name), routing::to_string(u.reason));
            }
            for (const auto& d : m.diagnostics) {
                logger()->warn(R"({{"event":"tag_diagnostic","order":"{}","item":"{}","tag":"{}","kind":"{}"}})",
                               json_escape(m.order.order_id), json_escape(d.item_id), json_escape(d.tag),
                               routing::to_string(d.kind));
            }
            for (const auto& w : m.config_warnings) {
                logger()->warn(R"({{"event":"config_warning","message":"{}"}})", json_escape(w));
            }
        }

        void on_dispatch(const dispatch::DispatchReport& r) override {
            const auto failed = r.failed();
            {
                std::lock_guard<std::mutex> lk(mu_);
                ctr_.dispatches++;
                ctr_.destinations_failed += failed.size();
            }
            const auto level = r.overall == dispatch::OverallStatus::Delivered ? spdlog::level::info
                                                                               : spdlog::level::warn;
            logger()->log(level,
                R"({{"event":"dispatch","order":"{}","overall":"{}","succeeded":{},"pending_retry":{},"failed":{}}})",
                json_escape(r.order_id), dispatch::to_string(r.overall), json_list(r.succeeded()),
                json_list(r.pending_retry()), json_list(failed));
        }

        void on_alert(const dispatch::OperatorAlert& a) override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                ctr_.alerts++;
            }
            logger()->error(R"({{"event":"alert","order":"{}","station":"{}","job":"{}","failover_to":"{}","message":"{}"}})",
                            json_escape(a.order_id), json_escape(a.station_id), json_escape(a.job_id),
                            json_escape(a.failover_to), json_escape(a.message));
        }

        void on_note(const dispatch::OperationalNote& n) override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                ctr_.notes++;
            }
            logger()->info(R"({{"event":"note","order":"{}","station":"{}","message":"{}"}})",
                           json_escape(n.order_id), json_escape(n.station_id), json_escape(n.message));
        }

        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }

    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_log_observer() {
        static LogObserver obs; // process-wide singleton
        return &obs;
    }

} // namespace galley::obs
