#pragma once
/**
 * @file ticket_builder.hpp
 * @brief Manifest entry -> abstract ticket (Print Template Factory).
 * @details Pure function of its inputs. The printed_at timestamp is passed in
 *          so identical inputs give identical tickets.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "galley/compat/expected.hpp"
#include "galley/print/instruction.hpp"
#include "galley/print/ticket_style.hpp"
#include "galley/routing/manifest.hpp"
#include "galley/routing/station.hpp"

namespace galley::print {

/** @struct BuildError
 *  @brief Reason a ticket could not be built for one entry.
 */
struct BuildError {
    enum class Code : std::uint8_t {
        MalformedStyle,   ///< find_style_problem() reported a problem
        EmptyEntry,       ///< Entry routes no items
        NotAPrinter       ///< Station is a display
    };
    Code        code{Code::MalformedStyle};
    std::string detail;
};

const char* to_string(BuildError::Code c) noexcept;

/**
 * @brief Render one station's share of a send as printer instructions.
 *
 * Layout: header (station, order number, table or tab, server, timestamp),
 * divider, one block per item (resend banner, quantity and name with seat
 * prefix, modifiers indented by depth, notes), optional reference section,
 * footer with the item count, trailing feed, optional buzzer, cut when the
 * station supports it.
 */
galley_detail::expected<Ticket, BuildError>
build_ticket(const routing::RoutingManifestEntry& entry,
             const routing::OrderContext& order,
             const routing::Station& station,
             const TicketStyle& style,
             std::chrono::system_clock::time_point printed_at);

/// Replace anything outside printable ASCII by '?' (one '?' per UTF-8 code point).
std::string sanitize_ascii(std::string_view in);

/// True when @p m should be rendered with destructive emphasis under @p style.
bool is_destructive(const routing::Modifier& m, const TicketStyle& style);

} // namespace galley::print
