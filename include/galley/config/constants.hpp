#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for routing, ticket rendering and dispatch.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          config Loader (YAML) in production deployments.
 */

#include <cstddef>
#include <cstdint>

namespace galley::config::constants {

// =====================
// Route tags / identifiers
// =====================
inline constexpr std::size_t TAG_MAX_LEN          = 32;  ///< Max characters in a route tag
inline constexpr std::size_t STATION_ID_MAX_LEN   = 48;  ///< Max characters in a station id
inline constexpr std::size_t MAX_STATIONS         = 256; ///< Registry capacity
inline constexpr std::size_t MAX_TAGS_PER_STATION = 32;  ///< Subscriptions per station

// =====================
// Printer addressing
// =====================
/// Raw TCP printing (HP JetDirect / "RAW" / AppSocket)
inline constexpr std::uint16_t PRINTER_DEFAULT_PORT = 9100;

// =====================
// Paper geometry (characters per line in font A)
// =====================
inline constexpr std::uint16_t PAPER_80MM_COLUMNS = 48;
inline constexpr std::uint16_t PAPER_58MM_COLUMNS = 32;
inline constexpr std::uint16_t PAPER_40MM_COLUMNS = 24;
inline constexpr std::uint16_t PAPER_DEFAULT_MM   = 80;

// =====================
// Ticket style limits (anything outside is a malformed style descriptor)
// =====================
inline constexpr std::uint16_t STYLE_MIN_COLUMNS        = 16;
inline constexpr std::uint16_t STYLE_MAX_COLUMNS        = 64;
inline constexpr std::uint8_t  STYLE_MAX_INDENT         = 8;
inline constexpr std::uint8_t  STYLE_DEFAULT_INDENT     = 2;
inline constexpr std::uint8_t  TICKET_TRAILING_FEED     = 4;  ///< Lines fed before the cut
inline constexpr std::uint8_t  TICKET_BUZZER_TIMES      = 2;  ///< Buzzer repetitions
inline constexpr std::uint8_t  TICKET_BUZZER_DURATION   = 3;  ///< Buzzer duration unit (x 100 ms)

// =====================
// Dispatch retry defaults (bounded exponential backoff)
// =====================
inline constexpr std::uint32_t DISPATCH_MAX_ATTEMPTS        = 4;
inline constexpr std::uint32_t DISPATCH_INITIAL_BACKOFF_MS  = 250;
inline constexpr double        DISPATCH_BACKOFF_MULTIPLIER  = 2.0;
inline constexpr std::uint32_t DISPATCH_MAX_BACKOFF_MS      = 4000;
inline constexpr std::uint32_t DISPATCH_ATTEMPT_TIMEOUT_MS  = 3000; ///< Write + acknowledgment
inline constexpr std::uint32_t DISPATCH_CONNECT_TIMEOUT_MS  = 1500;
inline constexpr std::uint32_t DISPATCH_DRAIN_TIMEOUT_MS    = 10000; ///< Shutdown drain window
inline constexpr bool          DISPATCH_REQUIRE_STATUS_ACK  = true;

// =====================
// Finished job retention (cancel lookups and job() queries)
// =====================
inline constexpr std::uint32_t DISPATCH_JOB_RETENTION_MS    = 30u * 60u * 1000u; ///< Keep finished jobs 30 min
inline constexpr std::size_t   DISPATCH_MAX_RETAINED_JOBS   = 1024;  ///< Oldest finished jobs go first

// =====================
// Display channels
// =====================
inline constexpr std::size_t CHANNEL_DEFAULT_CAPACITY = 64; ///< Per-subscriber queue (power-of-two)

} // namespace galley::config::constants
