/**
 * @file print_bundle.cpp
 * @brief Per-send ticket rendering.
 */
#include "galley/print/print_bundle.hpp"
#include "galley/print/ticket_builder.hpp"
#include "galley/obs/logger.hpp"

namespace galley::print {

using routing::Station;

const PrintTicket* PrintBundle::find(std::string_view station_id) const noexcept {
    for (const auto& t : tickets) {
        if (t.station_id == station_id) return &t;
    }
    return nullptr;
}

namespace {

/// Same ticket adapted to the backup printer's capabilities.
std::optional<Bytes> encode_for_backup(const Ticket& ticket, const Station& backup) {
    Ticket adapted;
    adapted.reserve(ticket.size());
    for (const auto& ins : ticket) {
        if (ins.op == Op::Cut && !backup.printer.supports_cut) continue;
        if (ins.op == Op::Buzzer && !backup.printer.buzzer) continue;
        adapted.push_back(ins);
    }
    if (backup.printer.supports_cut && (adapted.empty() || adapted.back().op != Op::Cut)) {
        adapted.push_back(Instruction::cut());
    }

    auto bytes = EscPosEncoder(backup.printer.dialect).encode(adapted);
    if (!bytes) {
        obs::logger()->warn("print: cannot encode ticket for backup '{}': {}",
                            backup.id, to_string(bytes.error().code));
        return std::nullopt;
    }
    return std::move(*bytes);
}

} // namespace

PrintBundle build_print_bundle(const routing::RoutingManifest& manifest,
                               const routing::RegistrySnapshot& snapshot,
                               std::chrono::system_clock::time_point now) {
    PrintBundle bundle;

    for (const auto& entry : manifest.entries) {
        if (entry.kind != routing::StationKind::Printer) continue;

        const Station* st = snapshot.find(entry.station_id);
        if (!st) {
            bundle.failures.push_back({entry.station_id, "station not present in registry snapshot"});
            continue;
        }

        auto ticket = build_ticket(entry, manifest.order, *st, st->printer.style, now);
        if (!ticket) {
            std::string reason = std::string{to_string(ticket.error().code)} + ": " + ticket.error().detail;
            obs::logger()->error("print: build failed for '{}': {}", entry.station_id, reason);
            bundle.failures.push_back({entry.station_id, std::move(reason)});
            continue;
        }

        auto bytes = EscPosEncoder(st->printer.dialect).encode(*ticket);
        if (!bytes) {
            const auto& e = bytes.error();
            std::string reason = std::string{to_string(e.code)} + " at instruction " +
                                 std::to_string(e.index) + " (" + to_string(e.op) + ")";
            obs::logger()->error("print: encode failed for '{}': {}", entry.station_id, reason);
            bundle.failures.push_back({entry.station_id, std::move(reason)});
            continue;
        }

        PrintTicket pt;
        pt.station_id = entry.station_id;
        pt.address    = st->printer.address;
        pt.dialect    = st->printer.dialect;
        pt.ticket     = std::move(*ticket);
        pt.payload    = std::move(*bytes);

        if (!st->backup_station_id.empty()) {
            const Station* backup = snapshot.find(st->backup_station_id);
            if (backup && backup->is_printer() && backup->active) {
                pt.backup_payload = encode_for_backup(pt.ticket, *backup);
                if (pt.backup_payload) {
                    pt.backup_station_id = backup->id;
                    pt.backup_address    = backup->printer.address;
                }
            }
        }
        bundle.tickets.push_back(std::move(pt));
    }
    return bundle;
}

} // namespace galley::print
