#pragma once
/**
 * @file config_loader.hpp
 * @brief YAML loader for the engine configuration and for order snapshots.
 * @details All defaults reference named constants to avoid magic numbers.
 *          yaml-cpp exceptions never escape: they become ConfigError.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "galley/compat/expected.hpp"
#include "galley/config/constants.hpp"
#include "galley/dispatch/retry_policy.hpp"
#include "galley/obs/logger.hpp"
#include "galley/routing/order.hpp"
#include "galley/routing/route_tag.hpp"
#include "galley/routing/station.hpp"
#include "galley/routing/station_registry.hpp"

namespace galley::config {

    /** @struct ConfigError
     *  @brief Why a configuration or order file could not be loaded.
     */
    struct ConfigError {
        enum class Code : std::uint8_t {
            Io,        ///< File missing or unreadable
            Parse,     ///< Not valid YAML
            Invalid    ///< Valid YAML, invalid values
        };
        Code        code{Code::Invalid};
        std::string message;
    };

    const char* to_string(ConfigError::Code c) noexcept;

    /** @struct EngineConfig
     *  @brief Everything needed to bring the engine up.
     */
    struct EngineConfig {
        obs::LoggingConfig        logging;
        routing::TagRegistry      tags{routing::TagRegistry::with_defaults()};
        routing::StationList      stations;
        dispatch::RetryPolicy     retry;
        dispatch::RetentionPolicy retention;
        std::size_t               channel_capacity{constants::CHANNEL_DEFAULT_CAPACITY};
        std::chrono::milliseconds drain_timeout{constants::DISPATCH_DRAIN_TIMEOUT_MS};
        /// Non-fatal findings (misspelled tags dropped, ...).
        std::vector<std::string>  warnings;
    };

    /** @class Loader
     *  @brief Source of engine configuration and order snapshots.
     */
    class Loader {
    public:
        static galley_detail::expected<EngineConfig, ConfigError> load_from_file(const std::string& path);
        static galley_detail::expected<EngineConfig, ConfigError> load_from_string(const std::string& text);

        static galley_detail::expected<routing::OrderSnapshot, ConfigError> load_order_from_file(const std::string& path);
        static galley_detail::expected<routing::OrderSnapshot, ConfigError> load_order_from_string(const std::string& text);

        /**
         * @brief Publish @p cfg into @p registry as one snapshot (tags and stations together).
         * @return One message per station the registry rejected.
         */
        static std::vector<std::string> apply(const EngineConfig& cfg, routing::StationRegistry& registry);
    };

} // namespace galley::config
