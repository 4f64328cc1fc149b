/**
 * @file main.cpp
 * @brief galley_send: route one order file and deliver it.
 *
 * Usage:
 *   galley_send <config.yaml> <order.yaml> [--dry-run]
 *
 * Loads the engine configuration, publishes it into a StationRegistry, then
 * performs one send action. With --dry-run nothing is sent: the manifest and
 * a plain-text preview of every printer ticket are printed instead (decoded
 * back from the encoded bytes, so the preview shows what the printer would get).
 *
 * Exit codes: 0 delivered, 1 partially delivered, 2 not delivered, 3 bad input.
 */

#include <cstring>
#include <iostream>
#include <string>

#include "galley/config/config_loader.hpp"
#include "galley/dispatch/channel.hpp"
#include "galley/dispatch/dispatch_service.hpp"
#include "galley/dispatch/printer_transport.hpp"
#include "galley/engine.hpp"
#include "galley/obs/logger.hpp"
#include "galley/obs/observability.hpp"
#include "galley/print/escpos.hpp"
#include "galley/routing/station_registry.hpp"
#include "galley/version.hpp"

namespace {

/// Alerts go to the log and to stderr so an operator running the tool sees them.
class StderrAlertSink final : public galley::dispatch::OperatorAlertSink {
public:
    void raise(const galley::dispatch::OperatorAlert& a) override {
        std::cerr << "ALERT [" << a.station_id << "] " << a.message;
        if (!a.failover_to.empty()) std::cerr << " (failing over to " << a.failover_to << ")";
        std::cerr << "\n";
    }
};

void print_manifest(const galley::routing::RoutingManifest& m) {
    using galley::routing::to_string;
    std::cout << "order " << m.order.order_id << " (registry v" << m.registry_version << ")\n";
    for (const auto& e : m.entries) {
        std::cout << "  -> " << e.station_id << " [" << to_string(e.kind) << "] matched "
                  << galley::routing::join(e.matched_tags) << "\n";
        for (const auto& it : e.items) std::cout << "       " << it->quantity << "x " << it->name << "\n";
    }
    for (const auto& u : m.unrouted) {
        std::cout << "  !! unrouted " << u.item->id << " (" << u.item->name << "): " << to_string(u.reason) << "\n";
    }
    for (const auto& d : m.diagnostics) {
        std::cout << "  ?? item " << d.item_id << " tag '" << d.tag << "': " << to_string(d.kind) << "\n";
    }
    for (const auto& w : m.config_warnings) std::cout << "  config: " << w << "\n";
}

int dry_run(const galley::PreparedSend& p) {
    print_manifest(p.manifest);
    for (const auto& t : p.bundle.tickets) {
        auto decoded = galley::print::decode_escpos(t.payload, t.dialect);
        std::cout << "\n==== " << t.station_id << " @ " << t.address.host << ":" << t.address.port
                  << " (" << galley::routing::to_string(t.dialect) << ", " << t.payload.size() << " bytes)\n";
        if (!decoded) {
            std::cout << "  cannot decode payload: " << galley::print::to_string(decoded.error().code)
                      << " at offset " << decoded.error().offset << "\n";
            continue;
        }
        std::cout << galley::print::preview(*decoded);
    }
    for (const auto& f : p.bundle.failures) {
        std::cout << "\n==== " << f.station_id << ": NOT BUILT (" << f.reason << ")\n";
    }
    return p.bundle.failures.empty() ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <config.yaml> <order.yaml> [--dry-run]\n";
        return 3;
    }
    const bool dry = argc > 3 && std::strcmp(argv[3], "--dry-run") == 0;

    auto cfg = galley::config::Loader::load_from_file(argv[1]);
    if (!cfg) {
        std::cerr << "config: " << galley::config::to_string(cfg.error().code) << ": " << cfg.error().message << "\n";
        return 3;
    }
    if (auto lg = galley::obs::make_logger(cfg->logging); !lg) {
        std::cerr << "logging: " << lg.error() << "\n";
        return 3;
    }
    auto log = galley::obs::logger();
    log->info("galley_send {} starting", galley::version_string);
    for (const auto& w : cfg->warnings) log->warn("config: {}", w);

    auto order = galley::config::Loader::load_order_from_file(argv[2]);
    if (!order) {
        std::cerr << "order: " << galley::config::to_string(order.error().code) << ": " << order.error().message << "\n";
        return 3;
    }

    galley::routing::StationRegistry registry;
    for (const auto& r : galley::config::Loader::apply(*cfg, registry)) log->error("{}", r);

    galley::dispatch::ChannelHub hub(cfg->channel_capacity);
    galley::dispatch::DispatchContext dispatcher(
        hub, std::make_shared<galley::dispatch::TcpPrinterTransport>(), cfg->retry, cfg->retention);
    StderrAlertSink alerts;
    auto* observer = galley::obs::make_log_observer();
    dispatcher.set_observer(observer);
    dispatcher.set_alert_sink(&alerts);

    galley::Engine engine(registry, dispatcher, observer);

    int rc = 0;
    if (dry) {
        auto prepared = engine.prepare(*order);
        if (!prepared) {
            std::cerr << "send: " << galley::to_string(prepared.error().code) << ": " << prepared.error().message << "\n";
            rc = 3;
        } else {
            rc = dry_run(*prepared);
        }
    } else {
        auto sent = engine.send(*order);
        if (!sent) {
            std::cerr << "send: " << galley::to_string(sent.error().code) << ": " << sent.error().message << "\n";
            rc = 3;
        } else {
            print_manifest(sent->prepared.manifest);
            const auto report = sent->handle.wait();
            for (const auto& d : report.destinations) {
                std::cout << "  " << d.station_id << ": " << galley::dispatch::to_string(d.status);
                if (!d.delivered_via.empty()) std::cout << " via " << d.delivered_via;
                if (d.attempts) std::cout << " after " << d.attempts << " attempt(s)";
                if (!d.message.empty()) std::cout << " (" << d.message << ")";
                std::cout << "\n";
            }
            std::cout << "overall: " << galley::dispatch::to_string(report.overall) << "\n";
            switch (report.overall) {
                case galley::dispatch::OverallStatus::Delivered:          rc = 0; break;
                case galley::dispatch::OverallStatus::PartiallyDelivered: rc = 1; break;
                case galley::dispatch::OverallStatus::NotDelivered:       rc = 2; break;
            }
        }
    }

    dispatcher.shutdown(cfg->drain_timeout);
    galley::obs::shutdown_logging();
    return rc;
}
