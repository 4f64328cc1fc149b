#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade: routing/dispatch events + counters.
 * @details The default implementation writes one JSON-ish spdlog line per event.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include "galley/dispatch/report.hpp"
#include "galley/routing/manifest.hpp"

namespace galley::obs {

    /** @struct Counters
     *  @brief Process-level counters.
     */
    struct Counters {
        std::uint64_t manifests{0};          ///< Send events resolved
        std::uint64_t items_routed{0};
        std::uint64_t items_unrouted{0};
        std::uint64_t tag_diagnostics{0};
        std::uint64_t dispatches{0};         ///< Dispatch reports completed
        std::uint64_t destinations_failed{0};
        std::uint64_t alerts{0};
        std::uint64_t notes{0};
    };

    /** @class Observer
     *  @brief Observability sink interface. Implementations must be thread-safe.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        virtual void on_manifest(const routing::RoutingManifest& m) = 0;
        virtual void on_dispatch(const dispatch::DispatchReport& r) = 0;
        virtual void on_alert(const dispatch::OperatorAlert& a) = 0;
        virtual void on_note(const dispatch::OperationalNote& n) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Escape @p in for use inside a JSON string literal.
    std::string json_escape(std::string_view in);

    /// Process-wide observer logging through obs::logger().
    Observer* make_log_observer();

} // namespace galley::obs
