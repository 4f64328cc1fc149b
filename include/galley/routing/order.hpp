/**
 * @file order.hpp
 * @brief Order snapshot handed to the resolver on every send action.
 *
 * The snapshot is a read-only copy of what the POS sent: the engine never
 * writes back to the order. Tags arrive as raw strings and are validated by
 * the resolver so that bad spellings surface as diagnostics, not exceptions.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "galley/routing/route_tag.hpp"

namespace galley::routing {

/// Modifier attached to an item ("no pickles", "extra cheese", "side: fries > well done").
struct Modifier final {
  std::string   name;
  std::string   pre_modifier;   ///< "no", "extra", "light", ... (may be empty)
  std::int32_t  depth{0};       ///< 0 = direct modifier, 1 = modifier of a modifier, ...
  std::int32_t  quantity{1};

  bool operator==(const Modifier&) const = default;
};

/// One line of an order.
struct OrderItem final {
  std::string id;
  std::string name;
  std::int32_t quantity{1};

  std::vector<std::string> tags;           ///< Own route tags (override category tags when non-empty)
  std::string              category;       ///< Category display name
  std::vector<std::string> category_tags;  ///< Inherited when the item has no own tags

  std::vector<Modifier> modifiers;
  std::string           notes;             ///< Special instructions
  std::optional<std::int32_t> seat;
  std::string           course;            ///< "starter", "main", ...
  std::string           source_table;      ///< Abbreviation of the table the item was moved from
  std::uint32_t         resend_count{0};   ///< 0 = first send
  bool                  sent{false};       ///< Already sent by an earlier send action

  bool operator==(const OrderItem&) const = default;
};

/// Order-level fields copied onto every manifest and ticket header.
struct OrderContext final {
  std::string order_id;
  std::string order_number;     ///< Human-facing number, e.g. "1042"
  std::string order_type;       ///< "dine_in", "takeout", ...
  std::string table_name;
  std::string tab_name;
  std::string server_name;
  std::chrono::system_clock::time_point created_at{};

  bool operator==(const OrderContext&) const = default;
};

/// Input of one send action.
struct OrderSnapshot final {
  OrderContext           context;
  std::vector<OrderItem> items;
};

/// Where an item's effective tags came from.
enum class TagSource : std::uint8_t { None, Item, Category };

const char* to_string(TagSource s) noexcept;

/// Result of effective_tags().
struct EffectiveTags final {
  TagSource                source{TagSource::None};
  TagSet                   tags;       ///< Valid spellings, sorted and unique (may include unknown tags)
  std::vector<std::string> rejected;   ///< Spellings that are not valid route tags
};

/**
 * @brief Own tags when the item has any, otherwise its category's tags.
 *
 * Own tags override; the two sets are never merged. The decision is made on
 * the raw lists, so an item whose own tags are all misspelled does not fall
 * back to its category.
 */
EffectiveTags effective_tags(const OrderItem& item);

} // namespace galley::routing
