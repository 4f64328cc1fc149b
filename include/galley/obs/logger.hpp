#pragma once
/**
 * @file logger.hpp
 * @brief Process-wide spdlog logger named "galley".
 * @details Components call galley::obs::logger(); applications call
 *          make_logger() once at startup with the YAML "logging" section.
 *          Until then a stderr sink at info level is used.
 */

#include <cstddef>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "galley/compat/expected.hpp"

namespace galley::obs {

/** @struct LoggingConfig
 *  @brief Sink and level selection for the process logger.
 */
struct LoggingConfig {
    std::string level{"info"};          ///< trace|debug|info|warn|error|critical|off
    bool        console{true};          ///< Colored stderr sink
    std::string file;                   ///< Rotating file sink when non-empty
    std::size_t max_file_size{5u * 1024u * 1024u};
    std::size_t max_files{3};
    std::string pattern{"%Y-%m-%dT%H:%M:%S.%e [%^%l%$] [%t] %v"};
};

/// Current process logger (never null). Safe to call while make_logger() replaces it.
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Build and install the process logger.
 * @return The new logger, or a message when a sink cannot be created
 *         or @p cfg.level is not a known level name.
 */
galley_detail::expected<std::shared_ptr<spdlog::logger>, std::string>
make_logger(const LoggingConfig& cfg);

/// Flush and drop every registered logger.
void shutdown_logging();

} // namespace galley::obs
