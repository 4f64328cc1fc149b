/**
 * @file engine.cpp
 * @brief Send path: resolve a snapshot, build the print bundle, hand it to dispatch.
 */
#include "galley/engine.hpp"

#include "galley/obs/logger.hpp"
#include "galley/obs/observability.hpp"
#include "galley/routing/routing_resolver.hpp"

namespace galley {

const char* to_string(SendError::Code c) noexcept {
    switch (c) {
        case SendError::Code::MalformedOrder: return "malformed_order";
        case SendError::Code::Unavailable:    return "unavailable";
    }
    return "unknown";
}

galley_detail::expected<PreparedSend, SendError>
Engine::prepare(const routing::OrderSnapshot& order, std::chrono::system_clock::time_point now) const {
    auto snap = registry_.snapshot();
    auto manifest = routing::resolve_routing(order, *snap);
    if (!manifest) {
        obs::logger()->warn("order '{}' rejected: {}", order.context.order_id, routing::to_string(manifest.error()));
        return galley_detail::unexpected(
            SendError{SendError::Code::MalformedOrder, routing::to_string(manifest.error())});
    }
    if (observer_) observer_->on_manifest(*manifest);

    auto bundle = print::build_print_bundle(*manifest, *snap, now);
    for (const auto& f : bundle.failures) {
        obs::logger()->error("order '{}': ticket for '{}' not built: {}",
                             order.context.order_id, f.station_id, f.reason);
    }
    return PreparedSend{std::move(snap), std::move(*manifest), std::move(bundle)};
}

galley_detail::expected<SendResult, SendError> Engine::send(const routing::OrderSnapshot& order) {
    auto prepared = prepare(order);
    if (!prepared) return galley_detail::unexpected(prepared.error());

    auto handle = dispatcher_.begin_dispatch(prepared->manifest, prepared->bundle);
    if (!handle) {
        return galley_detail::unexpected(
            SendError{SendError::Code::Unavailable, dispatch::to_string(handle.error())});
    }
    return SendResult{std::move(*prepared), std::move(*handle)};
}

} // namespace galley
