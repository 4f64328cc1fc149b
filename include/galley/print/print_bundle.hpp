#pragma once
/**
 * @file print_bundle.hpp
 * @brief Rendered and encoded tickets for every printer entry of a manifest.
 * @details A failure to build or encode one station's ticket is recorded for
 *          that station only; the remaining stations still print.
 */

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "galley/print/escpos.hpp"
#include "galley/print/instruction.hpp"
#include "galley/routing/manifest.hpp"
#include "galley/routing/station_registry.hpp"

namespace galley::print {

/** @struct PrintTicket
 *  @brief Ready-to-send ticket for one printer station.
 */
struct PrintTicket {
    std::string             station_id;
    routing::PrinterAddress address;
    routing::PrinterDialect dialect{routing::PrinterDialect::Thermal};
    Ticket                  ticket;
    Bytes                   payload;

    /// Backup printer, set only when it exists, is an active printer and could encode the ticket.
    std::string             backup_station_id;
    routing::PrinterAddress backup_address;
    std::optional<Bytes>    backup_payload;
};

/** @struct BuildFailure
 *  @brief Station whose ticket could not be produced.
 */
struct BuildFailure {
    std::string station_id;
    std::string reason;
};

struct PrintBundle {
    std::vector<PrintTicket>  tickets;
    std::vector<BuildFailure> failures;

    [[nodiscard]] const PrintTicket* find(std::string_view station_id) const noexcept;
};

/**
 * @brief Build and encode a ticket for every printer entry of @p manifest.
 * @param snapshot Registry snapshot the manifest was resolved against.
 * @param now      Timestamp printed on every ticket of this send.
 */
PrintBundle build_print_bundle(const routing::RoutingManifest& manifest,
                               const routing::RegistrySnapshot& snapshot,
                               std::chrono::system_clock::time_point now);

} // namespace galley::print
