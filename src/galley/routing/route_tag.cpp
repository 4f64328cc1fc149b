/**
 * @file route_tag.cpp
 * @brief RouteTag validation and TagRegistry lookups.
 */
#include "galley/routing/route_tag.hpp"
#include "galley/config/constants.hpp"

#include <algorithm>
#include <iterator>

namespace galley::routing {

const char* to_string(TagErr e) noexcept {
    switch (e) {
        case TagErr::Empty:   return "empty";
        case TagErr::TooLong: return "too_long";
        case TagErr::BadChar: return "bad_char";
    }
    return "unknown";
}

galley_detail::expected<RouteTag, TagErr> RouteTag::parse(std::string_view text) {
    const auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back()))  text.remove_suffix(1);

    if (text.empty()) return galley_detail::unexpected(TagErr::Empty);
    if (text.size() > config::constants::TAG_MAX_LEN) return galley_detail::unexpected(TagErr::TooLong);

    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        const bool ok = (c == '_' || c == '-' ||
                         (c >= '0' && c <= '9') ||
                         (c >= 'a' && c <= 'z'));
        if (!ok) return galley_detail::unexpected(TagErr::BadChar);
        out.push_back(c);
    }
    return RouteTag{std::move(out)};
}

TagSet make_tag_set(const std::vector<std::string>& raw, std::vector<std::string>* rejected) {
    TagSet out;
    out.reserve(raw.size());
    for (const auto& r : raw) {
        auto t = RouteTag::parse(r);
        if (!t) {
            if (rejected) rejected->push_back(r);
            continue;
        }
        out.push_back(std::move(*t));
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

TagSet intersect(const TagSet& a, const TagSet& b) {
    TagSet out;
    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
    return out;
}

void merge_into(TagSet& into, const TagSet& extra) {
    TagSet merged;
    merged.reserve(into.size() + extra.size());
    std::set_union(into.begin(), into.end(), extra.begin(), extra.end(), std::back_inserter(merged));
    into = std::move(merged);
}

std::string join(const TagSet& tags) {
    std::string out;
    for (const auto& t : tags) {
        if (!out.empty()) out.push_back(',');
        out += t.str();
    }
    return out;
}

//------------------------------- TagRegistry ----------------------------------

bool TagRegistry::add(RouteTag tag, std::string description) {
    return tags_.emplace(std::move(tag), std::move(description)).second;
}

bool TagRegistry::is_known(const RouteTag& tag) const noexcept {
    return tags_.find(tag) != tags_.end();
}

std::string_view TagRegistry::description(const RouteTag& tag) const noexcept {
    const auto it = tags_.find(tag);
    return it == tags_.end() ? std::string_view{} : std::string_view{it->second};
}

TagSet TagRegistry::tags() const {
    TagSet out;
    out.reserve(tags_.size());
    for (const auto& kv : tags_) out.push_back(kv.first);
    return out;
}

TagSet TagRegistry::filter_known(const TagSet& in, TagSet& unknown) const {
    TagSet known;
    known.reserve(in.size());
    for (const auto& t : in) {
        if (is_known(t)) known.push_back(t);
        else             unknown.push_back(t);
    }
    return known;
}

TagRegistry TagRegistry::with_defaults() {
    // Seed list used for fresh installs; sites extend it via the YAML "tags" section.
    static constexpr std::pair<const char*, const char*> seed[] = {
        {"kitchen",       "General kitchen items"},
        {"bar",           "Bar and drink items"},
        {"pizza",         "Pizza make line"},
        {"grill",         "Grill station items"},
        {"fryer",         "Fryer station items"},
        {"salad",         "Cold prep / salad station"},
        {"expo",          "Expeditor"},
        {"made-to-order", "Items requiring cook attention"},
        {"rush",          "Priority items"},
    };
    TagRegistry reg;
    for (const auto& [name, desc] : seed) {
        if (auto t = RouteTag::parse(name)) reg.add(std::move(*t), desc);
    }
    return reg;
}

} // namespace galley::routing
