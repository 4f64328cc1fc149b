/**
 * @file manifest.hpp
 * @brief Routing manifest: which station receives which items for one send.
 *
 * Items routed to several stations are shared through ItemRef, so every entry
 * refers to the same immutable OrderItem object.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "galley/routing/order.hpp"
#include "galley/routing/route_tag.hpp"
#include "galley/routing/station.hpp"

namespace galley::routing {

using ItemRef = std::shared_ptr<const OrderItem>;

/// Items destined for one station.
struct RoutingManifestEntry final {
  std::string          station_id;
  std::string          station_name;
  StationKind          kind{StationKind::Display};
  TagSet               matched_tags;     ///< Union of the per-item intersections
  std::vector<ItemRef> items;            ///< Original order of the send
  std::vector<ItemRef> reference_items;  ///< Other items of the send (only when the station shows them)
};

enum class UnroutedReason : std::uint8_t {
  NoTags,            ///< Neither item nor category carries tags
  OnlyUnknownTags,   ///< Every tag was unknown or misspelled
  NoMatchingStation  ///< Known tags, but no active station subscribes to them
};

const char* to_string(UnroutedReason r) noexcept;

struct UnroutedItem final {
  ItemRef        item;
  UnroutedReason reason{UnroutedReason::NoTags};
};

/// Per-item tag problem, reported instead of failing the send.
struct TagDiagnostic final {
  enum class Kind : std::uint8_t { UnknownTag, InvalidTag };

  std::string item_id;
  std::string tag;
  Kind        kind{Kind::UnknownTag};
};

const char* to_string(TagDiagnostic::Kind k) noexcept;

/// How one item was routed (for observers and the CLI).
struct ItemRouting final {
  std::string              item_id;
  TagSource                source{TagSource::None};
  TagSet                   effective_tags;   ///< Known tags only
  std::vector<std::string> station_ids;      ///< Empty when unrouted
};

struct ManifestStats final {
  std::size_t total{0};          ///< Items in the snapshot
  std::size_t routed{0};         ///< Items that reached at least one station
  std::size_t unrouted{0};
  std::size_t skipped_sent{0};   ///< Items already sent earlier
  std::size_t stations_used{0};
};

/// Output of resolve_routing().
struct RoutingManifest final {
  OrderContext                      order;
  std::uint64_t                     registry_version{0};
  std::vector<RoutingManifestEntry> entries;          ///< Ordered by station id
  std::vector<UnroutedItem>         unrouted;
  std::vector<TagDiagnostic>        diagnostics;
  std::vector<std::string>          config_warnings;
  std::vector<ItemRouting>          routing;          ///< One record per considered item
  ManifestStats                     stats;

  /// Entry for @p station_id, nullptr if the station receives nothing.
  [[nodiscard]] const RoutingManifestEntry* entry_for(std::string_view station_id) const noexcept;

  [[nodiscard]] bool fully_unrouted() const noexcept { return entries.empty() && !unrouted.empty(); }
};

} // namespace galley::routing
