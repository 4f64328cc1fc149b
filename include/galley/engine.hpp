#pragma once
/**
 * @file engine.hpp
 * @brief One send action end to end: snapshot, resolve, render, dispatch.
 *
 * The registry snapshot is taken once per send so that a concurrent
 * configuration change never splits one order across two station sets.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "galley/compat/expected.hpp"
#include "galley/dispatch/dispatch_service.hpp"
#include "galley/print/print_bundle.hpp"
#include "galley/routing/manifest.hpp"
#include "galley/routing/order.hpp"
#include "galley/routing/station_registry.hpp"

namespace galley::obs { class Observer; }

namespace galley {

/** @struct SendError
 *  @brief Why a send action did not start.
 */
struct SendError {
    enum class Code : std::uint8_t {
        MalformedOrder,   ///< resolve_routing() rejected the snapshot
        Unavailable       ///< Dispatch refused (shutting down, no transport)
    };
    Code        code{Code::MalformedOrder};
    std::string message;
};

const char* to_string(SendError::Code c) noexcept;

/** @struct PreparedSend
 *  @brief Everything computed before any byte leaves the process.
 */
struct PreparedSend {
    std::shared_ptr<const routing::RegistrySnapshot> snapshot;
    routing::RoutingManifest                         manifest;
    print::PrintBundle                               bundle;
};

/** @struct SendResult
 *  @brief A started send: the plan plus the live dispatch handle.
 */
struct SendResult {
    PreparedSend             prepared;
    dispatch::DispatchHandle handle;
};

/** @class Engine
 *  @brief Thin orchestration over the registry and the dispatch context.
 */
class Engine final {
public:
    Engine(routing::StationRegistry& registry, dispatch::DispatchContext& dispatcher,
           obs::Observer* observer = nullptr) noexcept
        : registry_(registry), dispatcher_(dispatcher), observer_(observer) {}

    /// Resolve and render without dispatching (dry run, previews).
    galley_detail::expected<PreparedSend, SendError>
    prepare(const routing::OrderSnapshot& order,
            std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    /// prepare() + begin_dispatch(). Returns as soon as delivery has started.
    galley_detail::expected<SendResult, SendError> send(const routing::OrderSnapshot& order);

    dispatch::CancelResult cancel_order(const std::string& order_id) { return dispatcher_.cancel_order(order_id); }

private:
    routing::StationRegistry&  registry_;
    dispatch::DispatchContext& dispatcher_;
    obs::Observer*             observer_;
};

} // namespace galley
