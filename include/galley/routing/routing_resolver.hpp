/**
 * @file routing_resolver.hpp
 * @brief Pure mapping (order snapshot, registry snapshot) -> routing manifest.
 *
 * The resolver performs no I/O and holds no state: the same inputs always
 * produce the same manifest. Routing anomalies (unknown tags, items nobody
 * subscribes to) are data in the manifest; only malformed input is an error.
 */
#pragma once

#include <cstdint>

#include "galley/compat/expected.hpp"
#include "galley/routing/manifest.hpp"
#include "galley/routing/order.hpp"
#include "galley/routing/station_registry.hpp"

namespace galley::routing {

/// Malformed-input reasons. Routing problems are never errors.
enum class ResolveError : std::uint8_t {
  EmptyOrderId,
  EmptyItemId,
  DuplicateItemId,
  NonPositiveQuantity,
  NegativeModifierDepth
};

const char* to_string(ResolveError e) noexcept;

/**
 * @brief Route every not-yet-sent item of @p order against @p snapshot.
 *
 * @note Semantics:
 *  - Items with `sent` set are skipped and counted in stats.skipped_sent.
 *  - Effective tags: own tags if any, else category tags (never merged).
 *  - Unknown or misspelled tags are dropped with a TagDiagnostic.
 *  - An item goes to every active station whose tags intersect its effective tags.
 *  - Entries are ordered by station id; items keep their order in the send.
 */
galley_detail::expected<RoutingManifest, ResolveError>
resolve_routing(const OrderSnapshot& order, const RegistrySnapshot& snapshot);

} // namespace galley::routing
