/**
 * @file ticket_builder.cpp
 * @brief Ticket layout.
 */
#include "galley/print/ticket_builder.hpp"
#include "galley/config/constants.hpp"

#include <algorithm>
#include <ctime>

namespace galley::print {

using routing::ItemRef;
using routing::Modifier;
using routing::OrderItem;

const char* to_string(BuildError::Code c) noexcept {
    switch (c) {
        case BuildError::Code::MalformedStyle: return "malformed_style";
        case BuildError::Code::EmptyEntry:     return "empty_entry";
        case BuildError::Code::NotAPrinter:    return "not_a_printer";
    }
    return "unknown";
}

std::string sanitize_ascii(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        const auto c = static_cast<unsigned char>(in[i]);
        if (c >= 0x20 && c <= 0x7E) {
            out.push_back(static_cast<char>(c));
            continue;
        }
        out.push_back('?');
        if (c >= 0xC0) {
            // Skip the continuation bytes of a multi-byte sequence.
            while (i + 1 < in.size() && (static_cast<unsigned char>(in[i + 1]) & 0xC0) == 0x80) ++i;
        }
    }
    return out;
}

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

std::string upper(std::string s) {
    for (auto& c : s) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return s;
}

bool wide(TextSize s) noexcept {
    return s == TextSize::DoubleWidth || s == TextSize::Double;
}

/// Split @p text into lines of at most @p width characters, breaking on spaces when possible.
/// Continuation lines get @p hang fewer characters so the caller can indent them.
std::vector<std::string> wrap(const std::string& text, std::size_t width, std::size_t hang) {
    std::vector<std::string> lines;
    std::size_t pos   = 0;
    std::size_t avail = width;
    for (;;) {
        if (avail == 0 || text.size() - pos <= avail) {
            lines.push_back(text.substr(pos));
            break;
        }
        std::size_t cut = text.rfind(' ', pos + avail);
        if (cut == std::string::npos || cut <= pos) cut = pos + avail;
        lines.push_back(text.substr(pos, cut - pos));
        pos = cut;
        while (pos < text.size() && text[pos] == ' ') ++pos;
        if (pos >= text.size()) break;
        avail = width - hang;
    }
    return lines;
}

class Writer {
public:
    Writer(Ticket& out, std::uint16_t columns) : out_(out), columns_(columns) {}

    /// Emit @p value formatted by @p e; continuation lines are indented by @p hang spaces.
    void line(const ElementStyle& e, const std::string& value, std::size_t hang = 0) {
        if (!e.enabled) return;
        std::string text = e.prefix + sanitize_ascii(value) + e.suffix;
        if (e.caps) text = upper(std::move(text));

        if (e.align != Align::Left)      out_.push_back(Instruction::align(e.align));
        if (e.size != TextSize::Normal)  out_.push_back(Instruction::size(e.size));
        if (e.bold)                      out_.push_back(Instruction::bold(true));
        if (e.inverse)                   out_.push_back(Instruction::inverse(true));

        const std::size_t width  = wide(e.size) ? columns_ / 2u : columns_;
        const std::size_t indent = std::min(hang, width / 2);
        bool first = true;
        for (auto& piece : wrap(text, width, indent)) {
            if (!first) piece = std::string(indent, ' ') + piece;
            if (!piece.empty()) out_.push_back(Instruction::print(std::move(piece)));
            out_.push_back(Instruction::line_feed());
            first = false;
        }

        if (e.inverse)                   out_.push_back(Instruction::inverse(false));
        if (e.bold)                      out_.push_back(Instruction::bold(false));
        if (e.size != TextSize::Normal)  out_.push_back(Instruction::size(TextSize::Normal));
        if (e.align != Align::Left)      out_.push_back(Instruction::align(Align::Left));
    }

    void rule(char c) {
        out_.push_back(Instruction::print(std::string(columns_, c)));
        out_.push_back(Instruction::line_feed());
    }

    void blank() { out_.push_back(Instruction::line_feed()); }

private:
    Ticket&       out_;
    std::uint16_t columns_;
};

std::string format_time(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
    return std::string(buf, n);
}

std::string seat_prefix(const OrderItem& item) {
    std::string p;
    if (!item.source_table.empty()) p = "T" + item.source_table;
    if (item.seat) {
        if (!p.empty()) p += '-';
        p += "S" + std::to_string(*item.seat);
    }
    if (!p.empty()) p += ": ";
    return p;
}

std::string modifier_text(const Modifier& m) {
    std::string t;
    if (m.quantity > 1) t = std::to_string(m.quantity) + "x ";
    if (!m.pre_modifier.empty()) t += m.pre_modifier + " ";
    t += m.name;
    return t;
}

void item_block(Writer& w, const OrderItem& item, const TicketStyle& s) {
    if (item.resend_count > 0) {
        w.line(s.resend, "*** RESEND #" + std::to_string(item.resend_count) + " ***");
    }

    std::string head = s.show_seat ? seat_prefix(item) : std::string{};
    head += std::to_string(item.quantity) + "x ";
    w.line(s.item, head + item.name, head.size());

    for (const auto& m : item.modifiers) {
        const auto depth  = static_cast<std::size_t>(std::max(0, m.depth));
        const std::string indent(static_cast<std::size_t>(s.indent_per_depth) * (depth + 1), ' ');
        const std::string& glyph = s.depth_glyphs[std::min(depth, s.depth_glyphs.size() - 1)];
        const std::string lead = indent + glyph;
        if (is_destructive(m, s)) {
            w.line(s.destructive, lead + s.destructive_marker + modifier_text(m), lead.size());
        } else {
            w.line(s.modifier, lead + modifier_text(m), lead.size());
        }
    }

    if (!item.notes.empty()) {
        const std::string indent(s.indent_per_depth, ' ');
        w.line(s.notes, indent + item.notes, indent.size());
    }
}

} // namespace

bool is_destructive(const Modifier& m, const TicketStyle& style) {
    const std::string pre = lower(m.pre_modifier);
    std::string first = lower(m.name);
    if (const auto sp = first.find(' '); sp != std::string::npos) first.resize(sp);

    for (const auto& kw : style.destructive_keywords) {
        const std::string k = lower(kw);
        if (!pre.empty() && pre == k) return true;
        if (pre.empty() && first == k) return true;
    }
    return false;
}

galley_detail::expected<Ticket, BuildError>
build_ticket(const routing::RoutingManifestEntry& entry,
             const routing::OrderContext& order,
             const routing::Station& station,
             const TicketStyle& style,
             std::chrono::system_clock::time_point printed_at) {
    using namespace config::constants;

    if (!station.is_printer()) {
        return galley_detail::unexpected(BuildError{BuildError::Code::NotAPrinter, station.id});
    }
    if (entry.items.empty()) {
        return galley_detail::unexpected(BuildError{BuildError::Code::EmptyEntry, station.id});
    }
    const std::uint16_t columns = routing::columns_for_paper(station.printer.paper_width_mm);
    if (auto problem = find_style_problem(style, columns)) {
        return galley_detail::unexpected(BuildError{BuildError::Code::MalformedStyle, *problem});
    }

    Ticket t;
    Writer w(t, columns);
    t.push_back(Instruction::initialize());

    // Header
    w.line(style.station_name, station.name.empty() ? station.id : station.name);
    w.line(style.order_number, order.order_number.empty() ? order.order_id : order.order_number);
    if (!order.table_name.empty()) {
        w.line(style.table, order.table_name);
    } else if (!order.tab_name.empty()) {
        ElementStyle tab = style.table;
        tab.prefix = "Tab: ";
        w.line(tab, order.tab_name);
    }
    if (!order.server_name.empty()) w.line(style.server, order.server_name);
    w.line(style.timestamp, format_time(printed_at));
    w.rule(style.header_divider);

    // Items
    std::int64_t count = 0;
    for (const ItemRef& item : entry.items) {
        item_block(w, *item, style);
        count += item->quantity;
    }
    w.rule(style.divider);

    // Reference section
    if (!entry.reference_items.empty() && style.reference_header.enabled) {
        w.line(style.reference_header, style.reference_header_text);
        for (const ItemRef& item : entry.reference_items) {
            w.line(style.reference_item, std::to_string(item->quantity) + "x " + item->name);
        }
        w.rule(style.divider);
    }

    // Footer
    w.line(style.footer, std::to_string(count));

    t.push_back(Instruction::feed(TICKET_TRAILING_FEED));
    if (station.printer.buzzer) {
        t.push_back(Instruction::buzzer(TICKET_BUZZER_TIMES, TICKET_BUZZER_DURATION));
    }
    if (station.printer.supports_cut) t.push_back(Instruction::cut());
    return t;
}

} // namespace galley::print
