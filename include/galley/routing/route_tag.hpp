/**
 * @file route_tag.hpp
 * @brief Typed route tag identifier and the closed registry of known tags.
 *
 * Items publish to route tags, stations subscribe to them. A RouteTag can only
 * be obtained through RouteTag::parse(), which normalizes (trim + lower-case)
 * and validates the text, so two spellings of the same tag always compare
 * equal. Tags missing from the TagRegistry are "unknown": they never match a
 * station and are reported as diagnostics instead.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "galley/compat/expected.hpp"

namespace galley::routing {

/// Reasons a string is not a valid route tag.
enum class TagErr : std::uint8_t {
    Empty,       ///< Nothing left after trimming.
    TooLong,     ///< Longer than constants::TAG_MAX_LEN.
    BadChar      ///< Contains a character outside [a-z0-9_-].
};

const char* to_string(TagErr e) noexcept;

/**
 * @brief Validated, normalized route tag ("grill", "bar", "expo", ...).
 */
class RouteTag final {
public:
    /// Normalize and validate @p text.
    static galley_detail::expected<RouteTag, TagErr> parse(std::string_view text);

    const std::string& str() const noexcept { return value_; }

    auto operator<=>(const RouteTag&) const = default;
    bool operator==(const RouteTag&) const = default;

private:
    explicit RouteTag(std::string v) : value_(std::move(v)) {}

    std::string value_;
};

/// Sorted, duplicate-free set of tags.
using TagSet = std::vector<RouteTag>;

/// Build a TagSet, silently dropping duplicates. Invalid spellings go to @p rejected.
TagSet make_tag_set(const std::vector<std::string>& raw, std::vector<std::string>* rejected = nullptr);

/// Sorted intersection of two TagSets.
TagSet intersect(const TagSet& a, const TagSet& b);

/// Add @p extra into @p into, keeping it sorted and unique.
void merge_into(TagSet& into, const TagSet& extra);

/// Render "a,b,c" for logs.
std::string join(const TagSet& tags);

/**
 * @class TagRegistry
 * @brief Closed set of known route tags (tag -> human description).
 *
 * Immutable once built; replaced wholesale inside a StationRegistry snapshot.
 */
class TagRegistry final {
public:
    TagRegistry() = default;

    /// Register a tag. Returns false if it was already known.
    bool add(RouteTag tag, std::string description = {});

    [[nodiscard]] bool is_known(const RouteTag& tag) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return tags_.size(); }
    [[nodiscard]] bool empty() const noexcept { return tags_.empty(); }

    /// Description for a known tag, empty string otherwise.
    [[nodiscard]] std::string_view description(const RouteTag& tag) const noexcept;

    /// All known tags, sorted.
    [[nodiscard]] TagSet tags() const;

    /// Split @p in into known tags (returned) and unknown tags (appended to @p unknown).
    [[nodiscard]] TagSet filter_known(const TagSet& in, TagSet& unknown) const;

    /// Registry seeded with the common kitchen tags.
    static TagRegistry with_defaults();

    bool operator==(const TagRegistry&) const = default;

private:
    std::map<RouteTag, std::string, std::less<>> tags_;
};

} // namespace galley::routing
