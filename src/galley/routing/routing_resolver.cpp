/**
 * @file routing_resolver.cpp
 * @brief Tag intersection routing.
 */
#include "galley/routing/routing_resolver.hpp"

#include <map>
#include <set>
#include <string_view>

namespace galley::routing {

const char* to_string(ResolveError e) noexcept {
  switch (e) {
    case ResolveError::EmptyOrderId:          return "empty_order_id";
    case ResolveError::EmptyItemId:           return "empty_item_id";
    case ResolveError::DuplicateItemId:       return "duplicate_item_id";
    case ResolveError::NonPositiveQuantity:   return "non_positive_quantity";
    case ResolveError::NegativeModifierDepth: return "negative_modifier_depth";
  }
  return "unknown";
}

const char* to_string(UnroutedReason r) noexcept {
  switch (r) {
    case UnroutedReason::NoTags:            return "no_tags";
    case UnroutedReason::OnlyUnknownTags:   return "only_unknown_tags";
    case UnroutedReason::NoMatchingStation: return "no_matching_station";
  }
  return "unknown";
}

const char* to_string(TagDiagnostic::Kind k) noexcept {
  switch (k) {
    case TagDiagnostic::Kind::UnknownTag: return "unknown_tag";
    case TagDiagnostic::Kind::InvalidTag: return "invalid_tag";
  }
  return "unknown";
}

const RoutingManifestEntry* RoutingManifest::entry_for(std::string_view station_id) const noexcept {
  for (const auto& e : entries) {
    if (e.station_id == station_id) return &e;
  }
  return nullptr;
}

namespace {

galley_detail::expected<void, ResolveError> check_input(const OrderSnapshot& order) {
  if (order.context.order_id.empty()) return galley_detail::unexpected(ResolveError::EmptyOrderId);

  std::set<std::string_view> ids;
  for (const auto& item : order.items) {
    if (item.id.empty()) return galley_detail::unexpected(ResolveError::EmptyItemId);
    if (!ids.insert(item.id).second) return galley_detail::unexpected(ResolveError::DuplicateItemId);
    if (item.quantity <= 0) return galley_detail::unexpected(ResolveError::NonPositiveQuantity);
    for (const auto& m : item.modifiers) {
      if (m.depth < 0) return galley_detail::unexpected(ResolveError::NegativeModifierDepth);
    }
  }
  return {};
}

} // namespace

galley_detail::expected<RoutingManifest, ResolveError>
resolve_routing(const OrderSnapshot& order, const RegistrySnapshot& snapshot) {
  if (auto ok = check_input(order); !ok) return galley_detail::unexpected(ok.error());

  RoutingManifest m;
  m.order            = order.context;
  m.registry_version = snapshot.version;
  m.config_warnings  = snapshot.validate();
  m.stats.total      = order.items.size();

  // station id -> entry under construction; std::map keeps entries ordered by id.
  std::map<std::string_view, RoutingManifestEntry> building;
  std::vector<ItemRef> considered;
  const std::vector<const Station*> expos = snapshot.expo_stations();

  for (const auto& item : order.items) {
    if (item.sent) {
      ++m.stats.skipped_sent;
      continue;
    }
    auto ref = std::make_shared<const OrderItem>(item);
    considered.push_back(ref);

    EffectiveTags eff = effective_tags(item);
    for (const auto& bad : eff.rejected) {
      m.diagnostics.push_back({item.id, bad, TagDiagnostic::Kind::InvalidTag});
    }
    TagSet unknown;
    const TagSet known = snapshot.tags.filter_known(eff.tags, unknown);
    for (const auto& t : unknown) {
      m.diagnostics.push_back({item.id, t.str(), TagDiagnostic::Kind::UnknownTag});
    }

    ItemRouting rec{item.id, eff.source, known, {}};

    // Items without a usable tag still reach the expo stations.
    const std::vector<const Station*> targets = known.empty() ? expos : snapshot.stations_for_tags(known);
    for (const Station* st : targets) {
      auto [it, inserted] = building.try_emplace(st->id);
      RoutingManifestEntry& e = it->second;
      if (inserted) {
        e.station_id   = st->id;
        e.station_name = st->name;
        e.kind         = st->kind;
      }
      merge_into(e.matched_tags, st->expo ? known : intersect(st->tags, known));
      e.items.push_back(ref);
      rec.station_ids.push_back(st->id);
    }

    if (rec.station_ids.empty()) {
      UnroutedReason reason = UnroutedReason::NoMatchingStation;
      if (known.empty()) {
        reason = (eff.source == TagSource::None) ? UnroutedReason::NoTags : UnroutedReason::OnlyUnknownTags;
      }
      m.unrouted.push_back({ref, reason});
    } else {
      ++m.stats.routed;
    }
    m.routing.push_back(std::move(rec));
  }

  m.entries.reserve(building.size());
  for (auto& [id, e] : building) {
    const Station* st = snapshot.find(id);
    if (st && st->show_reference_items && !st->expo) {
      for (const auto& ref : considered) {
        bool here = false;
        for (const auto& mine : e.items) {
          if (mine == ref) { here = true; break; }
        }
        if (!here) e.reference_items.push_back(ref);
      }
    }
    m.entries.push_back(std::move(e));
  }

  m.stats.unrouted      = m.unrouted.size();
  m.stats.stations_used = m.entries.size();
  return m;
}

} // namespace galley::routing
