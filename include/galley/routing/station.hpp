/**
 * @file station.hpp
 * @brief Station model shared across routing, rendering and dispatch.
 *
 * A Station is a configured destination: either a kitchen display (receives
 * manifest entries over a broadcast channel) or a printer (receives encoded
 * tickets over a printer transport). Centralizing this type keeps comparisons
 * consistent between the registry, the resolver and the dispatch service.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "galley/config/constants.hpp"
#include "galley/print/ticket_style.hpp"
#include "galley/routing/route_tag.hpp"

namespace galley::routing {

/**
 * @brief Destination kind.
 *
 * @note Semantics:
 *  - Display: best-effort publish to connected subscribers.
 *  - Printer: print job with retry, acknowledgment and operator alerts.
 */
enum class StationKind : std::uint8_t {
  Display = 0,
  Printer = 1
};

const char* to_string(StationKind k) noexcept;

/// Byte protocol spoken by a printer station.
enum class PrinterDialect : std::uint8_t {
  Thermal = 0, ///< ESC/POS thermal (inverse, GS ! sizes, cutter)
  Impact  = 1  ///< ESC/POS impact (red ribbon instead of inverse, ESC ! sizes, no cutter)
};

const char* to_string(PrinterDialect d) noexcept;

/**
 * @brief Network address of a printer station.
 */
struct PrinterAddress final {
  std::string   host;                                             ///< IPv4/IPv6 literal or hostname
  std::uint16_t port{config::constants::PRINTER_DEFAULT_PORT};    ///< RAW port

  bool operator==(const PrinterAddress&) const = default;
};

/**
 * @brief Printer-only settings (ignored for displays).
 */
struct PrinterSettings final {
  PrinterAddress address;
  PrinterDialect dialect{PrinterDialect::Thermal};
  std::uint16_t  paper_width_mm{config::constants::PAPER_DEFAULT_MM}; ///< 80, 58 or 40
  bool           supports_cut{true};
  bool           buzzer{false};          ///< Sound the buzzer after each ticket
  print::TicketStyle style{print::TicketStyle::kitchen()};

  bool operator==(const PrinterSettings&) const = default;
};

/**
 * @brief Configured destination.
 *
 * @note No uniqueness is enforced here; the StationRegistry keys stations by id.
 */
struct Station final {
  /// Stable identifier, e.g. "grill-kds".
  std::string id;

  /// Name shown on ticket headers and displays, e.g. "Grill".
  std::string name;

  StationKind kind{StationKind::Display};

  /// Subscribed route tags (sorted, unique). Empty means the station never receives items.
  TagSet tags;

  /// Inactive stations never match.
  bool active{true};

  /// Show the other items of the same send as context (line cooks see the whole order).
  bool show_reference_items{false};

  /// Expo station: receives every item of a send whatever its tags, never reference items.
  bool expo{false};

  /// Printer to fail over to when this printer exhausts its retries (empty = none).
  std::string backup_station_id;

  PrinterSettings printer;

  [[nodiscard]] bool is_printer() const noexcept { return kind == StationKind::Printer; }

  /// Structural equality (compares all fields).
  bool operator==(const Station&) const = default;
};

/**
 * @brief Convenience alias for a list of stations.
 */
using StationList = std::vector<Station>;

/// Characters per line for a paper width in millimetres.
std::uint16_t columns_for_paper(std::uint16_t paper_width_mm) noexcept;

} // namespace galley::routing
