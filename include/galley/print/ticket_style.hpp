#pragma once
/**
 * @file ticket_style.hpp
 * @brief Declarative per-element formatting for printed tickets.
 * @details Stations differ in emphasis (a bar wants drink names large, a grill
 *          wants modifiers loud), so formatting is data, not code. Presets are
 *          provided; configuration overrides individual elements.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "galley/config/constants.hpp"
#include "galley/print/instruction.hpp"

namespace galley::print {

/** @struct ElementStyle
 *  @brief Formatting of one ticket element (a header field, an item line, ...).
 */
struct ElementStyle {
    bool        enabled{true};
    Align       align{Align::Left};
    TextSize    size{TextSize::Normal};
    bool        bold{false};
    bool        inverse{false};
    bool        caps{false};
    std::string prefix;   ///< Printed before the value
    std::string suffix;   ///< Printed after the value

    bool operator==(const ElementStyle&) const = default;
};

/** @struct TicketStyle
 *  @brief Complete style descriptor for one station's tickets.
 */
struct TicketStyle {
    // Header
    ElementStyle station_name;
    ElementStyle order_number;
    ElementStyle table;
    ElementStyle server;
    ElementStyle timestamp;

    // Items
    ElementStyle item;               ///< "2x BURGER"
    ElementStyle modifier;           ///< Regular modifier lines
    ElementStyle destructive;        ///< "NO PICKLES" style lines
    ElementStyle notes;              ///< Special instructions
    ElementStyle resend;             ///< "*** RESEND #2 ***"
    bool         show_seat{true};    ///< Prefix "S3: " / "T4-S3: "

    // Reference section (other items of the same send)
    ElementStyle reference_header;
    ElementStyle reference_item;
    std::string  reference_header_text{"--- OTHER ITEMS ---"};

    // Footer
    ElementStyle footer;             ///< "Items: 5"

    /// Leading glyph per modifier depth; deeper levels reuse the last glyph.
    std::vector<std::string> depth_glyphs{"- ", "> "};
    /// Spaces of indentation per nesting level (modifier depth d gets (d + 1) levels).
    std::uint8_t indent_per_depth{config::constants::STYLE_DEFAULT_INDENT};
    /// Textual marker placed before destructive modifiers (monochrome-safe emphasis).
    std::string  destructive_marker{"!! "};
    /// Pre-modifiers / leading words that make a modifier destructive.
    std::vector<std::string> destructive_keywords{"no", "without", "hold", "remove", "none"};

    char divider{'-'};
    char header_divider{'='};

    bool operator==(const TicketStyle&) const = default;

    /// Food prep preset: loud modifiers, inverse station banner.
    static TicketStyle kitchen();
    /// Bar preset: drink names double height, compact header.
    static TicketStyle bar();
};

/**
 * @brief Look up a preset by name ("kitchen", "bar").
 * @return std::nullopt for unknown names.
 */
std::optional<TicketStyle> style_preset(const std::string& name);

/**
 * @brief Check a style against the station's line width.
 * @return Description of the first problem found, std::nullopt if the style is usable.
 */
std::optional<std::string> find_style_problem(const TicketStyle& s, std::uint16_t columns);

} // namespace galley::print
