/**
 * @file config_loader.cpp
 * @brief yaml-cpp backed parsing of "logging", "tags", "stations", "dispatch" and orders.
 */
#include "galley/config/config_loader.hpp"
#include "galley/print/ticket_style.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace galley::config {
    using namespace galley::routing;
    using print::Align;
    using print::ElementStyle;
    using print::TextSize;
    using print::TicketStyle;

    const char* to_string(ConfigError::Code c) noexcept {
        switch (c) {
            case ConfigError::Code::Io:      return "io";
            case ConfigError::Code::Parse:   return "parse";
            case ConfigError::Code::Invalid: return "invalid";
        }
        return "unknown";
    }

    namespace {

    /// Collects validation errors so one pass reports all of them.
    struct Problems {
        std::vector<std::string> errors;
        std::vector<std::string>* warnings{nullptr};

        void error(std::string m) { errors.push_back(std::move(m)); }
        void warn(std::string m) { if (warnings) warnings->push_back(std::move(m)); }

        std::string joined() const {
            std::string out;
            for (const auto& e : errors) {
                if (!out.empty()) out += "; ";
                out += e;
            }
            return out;
        }
    };

    template <class T>
    T get_or(const YAML::Node& n, const char* key, T fallback) {
        const YAML::Node v = n[key];
        if (!v || v.IsNull()) return fallback;
        return v.as<T>();
    }

    std::vector<std::string> string_list(const YAML::Node& n) {
        std::vector<std::string> out;
        if (!n || n.IsNull()) return out;
        if (n.IsScalar()) {
            out.push_back(n.as<std::string>());
            return out;
        }
        for (const auto& v : n) out.push_back(v.as<std::string>());
        return out;
    }

    galley_detail::expected<std::string, ConfigError> read_file(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) return galley_detail::unexpected(ConfigError{ConfigError::Code::Io, "cannot open '" + path + "'"});
        std::ostringstream ss;
        ss << in.rdbuf();
        if (in.bad()) return galley_detail::unexpected(ConfigError{ConfigError::Code::Io, "cannot read '" + path + "'"});
        return ss.str();
    }

    // ------------------------------- tags -------------------------------------

    TagRegistry parse_tags(const YAML::Node& n, Problems& p) {
        TagRegistry reg;
        const auto add = [&](const std::string& name, const std::string& desc) {
            auto t = RouteTag::parse(name);
            if (!t) {
                p.error("tags: '" + name + "' is not a valid route tag (" + routing::to_string(t.error()) + ")");
                return;
            }
            if (!reg.add(std::move(*t), desc)) p.warn("tags: '" + name + "' listed twice");
        };

        if (n.IsMap()) {
            for (const auto& kv : n) add(kv.first.as<std::string>(), kv.second.IsNull() ? std::string{} : kv.second.as<std::string>());
        } else if (n.IsSequence()) {
            for (const auto& v : n) {
                if (v.IsMap()) add(get_or<std::string>(v, "name", ""), get_or<std::string>(v, "description", ""));
                else           add(v.as<std::string>(), {});
            }
        } else {
            p.error("tags: expected a list or a map");
        }
        return reg;
    }

    // ------------------------------- style ------------------------------------

    bool parse_align(const std::string& s, Align& out) {
        if (s == "left")   { out = Align::Left;   return true; }
        if (s == "center") { out = Align::Center; return true; }
        if (s == "right")  { out = Align::Right;  return true; }
        return false;
    }

    bool parse_size(const std::string& s, TextSize& out) {
        if (s == "normal")        { out = TextSize::Normal;       return true; }
        if (s == "double_height") { out = TextSize::DoubleHeight; return true; }
        if (s == "double_width")  { out = TextSize::DoubleWidth;  return true; }
        if (s == "double")        { out = TextSize::Double;       return true; }
        return false;
    }

    void parse_element(const YAML::Node& n, ElementStyle& e, const std::string& where, Problems& p) {
        e.enabled = get_or<bool>(n, "enabled", e.enabled);
        e.bold    = get_or<bool>(n, "bold", e.bold);
        e.inverse = get_or<bool>(n, "inverse", e.inverse);
        e.caps    = get_or<bool>(n, "caps", e.caps);
        e.prefix  = get_or<std::string>(n, "prefix", e.prefix);
        e.suffix  = get_or<std::string>(n, "suffix", e.suffix);
        if (n["align"] && !parse_align(n["align"].as<std::string>(), e.align)) {
            p.error(where + ".align: expected left|center|right");
        }
        if (n["size"] && !parse_size(n["size"].as<std::string>(), e.size)) {
            p.error(where + ".size: expected normal|double_height|double_width|double");
        }
    }

    TicketStyle parse_style(const YAML::Node& n, const std::string& where, Problems& p) {
        const std::string preset = get_or<std::string>(n, "preset", "kitchen");
        auto base = print::style_preset(preset);
        if (!base) {
            p.error(where + ".preset: unknown preset '" + preset + "'");
            return TicketStyle::kitchen();
        }
        TicketStyle s = *base;

        const int indent = get_or<int>(n, "indent_per_depth", s.indent_per_depth);
        if (indent < 0 || indent > constants::STYLE_MAX_INDENT) {
            p.error(where + ".indent_per_depth: must be 0.." + std::to_string(constants::STYLE_MAX_INDENT));
        } else {
            s.indent_per_depth = static_cast<std::uint8_t>(indent);
        }
        if (n["depth_glyphs"]) s.depth_glyphs = string_list(n["depth_glyphs"]);
        if (n["destructive_keywords"]) s.destructive_keywords = string_list(n["destructive_keywords"]);
        s.destructive_marker    = get_or<std::string>(n, "destructive_marker", s.destructive_marker);
        s.reference_header_text = get_or<std::string>(n, "reference_header_text", s.reference_header_text);
        s.show_seat             = get_or<bool>(n, "show_seat", s.show_seat);

        const std::string divider = get_or<std::string>(n, "divider", std::string(1, s.divider));
        if (divider.size() != 1) p.error(where + ".divider: expected one character");
        else                     s.divider = divider[0];

        if (const YAML::Node el = n["elements"]) {
            const std::pair<const char*, ElementStyle*> slots[] = {
                {"station_name", &s.station_name}, {"order_number", &s.order_number},
                {"table", &s.table},               {"server", &s.server},
                {"timestamp", &s.timestamp},       {"item", &s.item},
                {"modifier", &s.modifier},         {"destructive", &s.destructive},
                {"notes", &s.notes},               {"resend", &s.resend},
                {"reference_header", &s.reference_header},
                {"reference_item", &s.reference_item},
                {"footer", &s.footer},
            };
            for (const auto& kv : el) {
                const std::string key = kv.first.as<std::string>();
                bool found = false;
                for (const auto& [name, slot] : slots) {
                    if (key == name) {
                        parse_element(kv.second, *slot, where + ".elements." + key, p);
                        found = true;
                        break;
                    }
                }
                if (!found) p.error(where + ".elements: unknown element '" + key + "'");
            }
        }
        return s;
    }

    // ------------------------------ stations ----------------------------------

    Station parse_station(const YAML::Node& n, std::size_t index, Problems& p) {
        Station st;
        st.id   = get_or<std::string>(n, "id", "");
        const std::string where = "stations[" + (st.id.empty() ? std::to_string(index) : st.id) + "]";
        if (st.id.empty()) p.error(where + ".id: required");
        st.name = get_or<std::string>(n, "name", st.id);

        const std::string kind = get_or<std::string>(n, "kind", "display");
        if (kind == "display")      st.kind = StationKind::Display;
        else if (kind == "printer") st.kind = StationKind::Printer;
        else p.error(where + ".kind: expected display|printer");

        std::vector<std::string> rejected;
        st.tags = make_tag_set(string_list(n["tags"]), &rejected);
        for (const auto& r : rejected) p.warn(where + ".tags: dropped invalid tag '" + r + "'");

        st.active               = get_or<bool>(n, "active", true);
        st.show_reference_items = get_or<bool>(n, "show_reference_items", false);
        st.expo                 = get_or<bool>(n, "expo", false);
        st.backup_station_id    = get_or<std::string>(n, "backup", "");

        if (const YAML::Node pr = n["printer"]) {
            PrinterSettings& ps = st.printer;
            ps.address.host = get_or<std::string>(pr, "host", "");
            const int port  = get_or<int>(pr, "port", constants::PRINTER_DEFAULT_PORT);
            if (port <= 0 || port > 65535) p.error(where + ".printer.port: out of range");
            else ps.address.port = static_cast<std::uint16_t>(port);

            const std::string dialect = get_or<std::string>(pr, "dialect", "thermal");
            if (dialect == "thermal")     ps.dialect = PrinterDialect::Thermal;
            else if (dialect == "impact") ps.dialect = PrinterDialect::Impact;
            else p.error(where + ".printer.dialect: expected thermal|impact");

            const int width = get_or<int>(pr, "paper_width_mm", constants::PAPER_DEFAULT_MM);
            if (width != 80 && width != 58 && width != 40) p.error(where + ".printer.paper_width_mm: expected 80, 58 or 40");
            else ps.paper_width_mm = static_cast<std::uint16_t>(width);

            // Impact printers have no cutter unless told otherwise.
            ps.supports_cut = get_or<bool>(pr, "supports_cut", ps.dialect == PrinterDialect::Thermal);
            ps.buzzer       = get_or<bool>(pr, "buzzer", false);
        } else if (st.kind == StationKind::Printer) {
            p.warn(where + ": printer station without a printer section");
        }

        if (const YAML::Node style = n["style"]) {
            st.printer.style = parse_style(style, where + ".style", p);
            const auto columns = columns_for_paper(st.printer.paper_width_mm);
            if (auto problem = print::find_style_problem(st.printer.style, columns)) {
                p.error(where + ".style: " + *problem);
            }
        } else if (st.kind == StationKind::Printer) {
            st.printer.style = TicketStyle::kitchen();
        }
        return st;
    }

    // ------------------------------ dispatch ----------------------------------

    dispatch::RetryPolicy parse_dispatch(const YAML::Node& n, EngineConfig& cfg, Problems& p) {
        using std::chrono::milliseconds;
        dispatch::RetryPolicy r;
        if (!n) return r;

        const auto ms = [&](const char* key, milliseconds fallback) {
            const auto v = get_or<std::int64_t>(n, key, fallback.count());
            if (v < 0) {
                p.error(std::string{"dispatch."} + key + ": must not be negative");
                return fallback;
            }
            return milliseconds{v};
        };

        const auto attempts = get_or<std::int64_t>(n, "max_attempts", r.max_attempts);
        if (attempts < 1) p.error("dispatch.max_attempts: must be at least 1");
        else r.max_attempts = static_cast<std::uint32_t>(attempts);

        r.initial_backoff    = ms("initial_backoff_ms", r.initial_backoff);
        r.multiplier         = get_or<double>(n, "backoff_multiplier", r.multiplier);
        r.max_backoff        = ms("max_backoff_ms", r.max_backoff);
        r.attempt_timeout    = ms("attempt_timeout_ms", r.attempt_timeout);
        r.connect_timeout    = ms("connect_timeout_ms", r.connect_timeout);
        r.require_status_ack = get_or<bool>(n, "require_status_ack", r.require_status_ack);
        cfg.drain_timeout    = ms("drain_timeout_ms", cfg.drain_timeout);
        cfg.retention.window = ms("job_retention_ms", cfg.retention.window);

        const auto retained = get_or<std::int64_t>(n, "max_retained_jobs",
                                                   static_cast<std::int64_t>(cfg.retention.max_jobs));
        if (retained < 0) p.error("dispatch.max_retained_jobs: must not be negative");
        else cfg.retention.max_jobs = static_cast<std::size_t>(retained);

        const auto cap = get_or<std::int64_t>(n, "channel_capacity", static_cast<std::int64_t>(cfg.channel_capacity));
        if (cap < 2 || (cap & (cap - 1)) != 0) p.error("dispatch.channel_capacity: must be a power of two >= 2");
        else cfg.channel_capacity = static_cast<std::size_t>(cap);

        if (const std::string problem = dispatch::validate(r); !problem.empty()) p.error("dispatch: " + problem);
        return r;
    }

    // ------------------------------- orders -----------------------------------

    Modifier parse_modifier(const YAML::Node& n) {
        Modifier m;
        if (n.IsScalar()) {
            m.name = n.as<std::string>();
            return m;
        }
        m.name         = get_or<std::string>(n, "name", "");
        m.pre_modifier = get_or<std::string>(n, "pre", "");
        m.depth        = get_or<std::int32_t>(n, "depth", 0);
        m.quantity     = get_or<std::int32_t>(n, "qty", 1);
        return m;
    }

    OrderItem parse_item(const YAML::Node& n) {
        OrderItem it;
        it.id            = get_or<std::string>(n, "id", "");
        it.name          = get_or<std::string>(n, "name", "");
        it.quantity      = get_or<std::int32_t>(n, "qty", 1);
        it.tags          = string_list(n["tags"]);
        it.category      = get_or<std::string>(n, "category", "");
        it.category_tags = string_list(n["category_tags"]);
        for (const auto& m : n["modifiers"]) it.modifiers.push_back(parse_modifier(m));
        it.notes         = get_or<std::string>(n, "notes", "");
        if (n["seat"] && !n["seat"].IsNull()) it.seat = n["seat"].as<std::int32_t>();
        it.course        = get_or<std::string>(n, "course", "");
        it.source_table  = get_or<std::string>(n, "source_table", "");
        it.resend_count  = get_or<std::uint32_t>(n, "resend_count", 0);
        it.sent          = get_or<bool>(n, "sent", false);
        return it;
    }

    } // namespace

    galley_detail::expected<EngineConfig, ConfigError> Loader::load_from_string(const std::string& text) {
        EngineConfig cfg;
        Problems p;
        p.warnings = &cfg.warnings;

        try {
            const YAML::Node root = YAML::Load(text);
            if (!root.IsNull() && !root.IsMap()) {
                return galley_detail::unexpected(ConfigError{ConfigError::Code::Invalid, "top level must be a map"});
            }

            if (const YAML::Node lg = root["logging"]) {
                cfg.logging.level   = get_or<std::string>(lg, "level", cfg.logging.level);
                cfg.logging.file    = get_or<std::string>(lg, "file", cfg.logging.file);
                cfg.logging.console = get_or<bool>(lg, "console", cfg.logging.console);
                cfg.logging.pattern = get_or<std::string>(lg, "pattern", cfg.logging.pattern);
            }

            if (const YAML::Node tags = root["tags"]) cfg.tags = parse_tags(tags, p);

            if (const YAML::Node stations = root["stations"]) {
                std::size_t i = 0;
                for (const auto& sn : stations) {
                    Station st = parse_station(sn, i++, p);
                    for (const auto& prev : cfg.stations) {
                        if (prev.id == st.id) p.error("stations: duplicate id '" + st.id + "'");
                    }
                    cfg.stations.push_back(std::move(st));
                }
            }

            cfg.retry = parse_dispatch(root["dispatch"], cfg, p);
        } catch (const YAML::ParserException& e) {
            return galley_detail::unexpected(ConfigError{ConfigError::Code::Parse, e.what()});
        } catch (const YAML::Exception& e) {
            return galley_detail::unexpected(ConfigError{ConfigError::Code::Invalid, e.what()});
        }

        if (!p.errors.empty()) {
            return galley_detail::unexpected(ConfigError{ConfigError::Code::Invalid, p.joined()});
        }
        return cfg;
    }

    galley_detail::expected<EngineConfig, ConfigError> Loader::load_from_file(const std::string& path) {
        auto text = read_file(path);
        if (!text) return galley_detail::unexpected(text.error());
        auto cfg = load_from_string(*text);
        if (!cfg) {
            ConfigError e = cfg.error();
            e.message = path + ": " + e.message;
            return galley_detail::unexpected(std::move(e));
        }
        return cfg;
    }

    galley_detail::expected<OrderSnapshot, ConfigError> Loader::load_order_from_string(const std::string& text) {
        OrderSnapshot o;
        try {
            const YAML::Node root = YAML::Load(text);
            const YAML::Node n = root["order"] ? root["order"] : root;
            if (!n.IsMap()) {
                return galley_detail::unexpected(ConfigError{ConfigError::Code::Invalid, "order must be a map"});
            }
            o.context.order_id     = get_or<std::string>(n, "id", "");
            o.context.order_number = get_or<std::string>(n, "number", "");
            o.context.order_type   = get_or<std::string>(n, "type", "");
            o.context.table_name   = get_or<std::string>(n, "table", "");
            o.context.tab_name     = get_or<std::string>(n, "tab", "");
            o.context.server_name  = get_or<std::string>(n, "server", "");
            o.context.created_at   = std::chrono::system_clock::now();
            for (const auto& item : n["items"]) o.items.push_back(parse_item(item));
        } catch (const YAML::ParserException& e) {
            return galley_detail::unexpected(ConfigError{ConfigError::Code::Parse, e.what()});
        } catch (const YAML::Exception& e) {
            return galley_detail::unexpected(ConfigError{ConfigError::Code::Invalid, e.what()});
        }
        return o;
    }

    galley_detail::expected<OrderSnapshot, ConfigError> Loader::load_order_from_file(const std::string& path) {
        auto text = read_file(path);
        if (!text) return galley_detail::unexpected(text.error());
        return load_order_from_string(*text);
    }

    std::vector<std::string> Loader::apply(const EngineConfig& cfg, StationRegistry& registry) {
        std::vector<std::string> rejected;
        for (const auto& r : registry.replaceAll(cfg.tags, cfg.stations)) {
            rejected.push_back("station '" + r.id + "' rejected: " + routing::to_string(r.err));
        }
        return rejected;
    }

} // namespace galley::config
