/**
 * @file ticket_style.cpp
 * @brief Style presets and style validation.
 */
#include "galley/print/ticket_style.hpp"

namespace galley::print {

namespace {

bool printable(const std::string& s) noexcept {
    for (unsigned char c : s) {
        if (c < 0x20 || c > 0x7E) return false;
    }
    return true;
}

} // namespace

TicketStyle TicketStyle::kitchen() {
    TicketStyle s;
    s.station_name = {.align = Align::Center, .size = TextSize::Double, .bold = true, .inverse = true, .caps = true};
    s.order_number = {.align = Align::Center, .size = TextSize::DoubleHeight, .bold = true, .prefix = "#"};
    s.table        = {.size = TextSize::DoubleHeight, .bold = true, .prefix = "Table: "};
    s.server       = {.prefix = "Server: "};
    s.timestamp    = {};
    s.item         = {.size = TextSize::DoubleHeight, .bold = true, .caps = true};
    s.modifier     = {};
    s.destructive  = {.bold = true, .inverse = true, .caps = true};
    s.notes        = {.bold = true, .prefix = "NOTE: "};
    s.resend       = {.align = Align::Center, .bold = true, .inverse = true};
    s.reference_header = {.align = Align::Center};
    s.reference_item   = {.prefix = "  "};
    s.footer       = {.align = Align::Center, .prefix = "Items: "};
    return s;
}

TicketStyle TicketStyle::bar() {
    TicketStyle s;
    s.station_name = {.align = Align::Center, .size = TextSize::DoubleWidth, .bold = true, .caps = true};
    s.order_number = {.align = Align::Center, .bold = true, .prefix = "#"};
    s.table        = {.bold = true, .prefix = "Table: "};
    s.server       = {.enabled = false};
    s.timestamp    = {};
    s.item         = {.size = TextSize::DoubleHeight, .bold = true};
    s.modifier     = {};
    s.destructive  = {.bold = true, .inverse = true};
    s.notes        = {.prefix = "NOTE: "};
    s.resend       = {.align = Align::Center, .bold = true};
    s.reference_header = {.enabled = false};
    s.reference_item   = {.enabled = false};
    s.footer       = {.enabled = false};
    s.depth_glyphs = {"+ "};
    s.divider      = '.';
    return s;
}

std::optional<TicketStyle> style_preset(const std::string& name) {
    if (name == "kitchen") return TicketStyle::kitchen();
    if (name == "bar")     return TicketStyle::bar();
    return std::nullopt;
}

std::optional<std::string> find_style_problem(const TicketStyle& s, std::uint16_t columns) {
    using namespace galley::config::constants;

    if (columns < STYLE_MIN_COLUMNS || columns > STYLE_MAX_COLUMNS) {
        return "column width " + std::to_string(columns) + " outside " +
               std::to_string(STYLE_MIN_COLUMNS) + ".." + std::to_string(STYLE_MAX_COLUMNS);
    }
    if (s.indent_per_depth > STYLE_MAX_INDENT) {
        return "indent_per_depth " + std::to_string(s.indent_per_depth) + " above " +
               std::to_string(STYLE_MAX_INDENT);
    }
    if (s.depth_glyphs.empty()) return std::string{"depth_glyphs is empty"};
    for (const auto& g : s.depth_glyphs) {
        if (!printable(g)) return std::string{"depth glyph contains unprintable characters"};
    }
    if (!printable(s.destructive_marker)) return std::string{"destructive_marker contains unprintable characters"};
    if (!printable(s.reference_header_text)) return std::string{"reference_header_text contains unprintable characters"};
    if (!printable(std::string(1, s.divider)) || !printable(std::string(1, s.header_divider))) {
        return std::string{"divider is not printable"};
    }

    // Items and their modifiers are what the line cooks act on; they cannot be switched off.
    if (!s.item.enabled)        return std::string{"item: element cannot be disabled"};
    if (!s.modifier.enabled)    return std::string{"modifier: element cannot be disabled"};
    if (!s.destructive.enabled) return std::string{"destructive: element cannot be disabled"};
    if (!s.destructive.bold && !s.destructive.inverse && s.destructive_marker.empty()) {
        return std::string{"destructive: needs bold, inverse or a destructive_marker"};
    }

    const std::pair<const char*, const ElementStyle*> elements[] = {
        {"station_name", &s.station_name}, {"order_number", &s.order_number},
        {"table", &s.table},               {"server", &s.server},
        {"timestamp", &s.timestamp},       {"item", &s.item},
        {"modifier", &s.modifier},         {"destructive", &s.destructive},
        {"notes", &s.notes},               {"resend", &s.resend},
        {"reference_header", &s.reference_header},
        {"reference_item", &s.reference_item},
        {"footer", &s.footer},
    };
    for (const auto& [name, e] : elements) {
        if (!printable(e->prefix) || !printable(e->suffix)) {
            return std::string{name} + ": prefix/suffix contains unprintable characters";
        }
    }
    return std::nullopt;
}

} // namespace galley::print
