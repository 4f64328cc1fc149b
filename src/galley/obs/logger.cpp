/**
 * @file logger.cpp
 * @brief spdlog sink assembly for the "galley" logger.
 */
#include "galley/obs/logger.hpp"

#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <atomic>
#include <vector>

namespace galley::obs {

namespace {

constexpr const char* kLoggerName = "galley";

std::shared_ptr<spdlog::logger> make_default() {
    auto sink = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>();
    auto l = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
    l->set_level(spdlog::level::info);
    return l;
}

// Read and replaced through std::atomic_load / std::atomic_store only.
std::shared_ptr<spdlog::logger>& current() {
    static std::shared_ptr<spdlog::logger> galley_logger = make_default();
    return galley_logger;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    return std::atomic_load(&current());
}

galley_detail::expected<std::shared_ptr<spdlog::logger>, std::string>
make_logger(const LoggingConfig& cfg) try {
    const auto level = spdlog::level::from_str(cfg.level);
    // from_str() maps unknown names to "off"; only accept "off" when asked for.
    if (level == spdlog::level::off && cfg.level != "off") {
        return galley_detail::unexpected(std::string{"unknown log level '"} + cfg.level + "'");
    }

    std::vector<spdlog::sink_ptr> sinks;
    if (cfg.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>());
    }
    if (!cfg.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            cfg.file, cfg.max_file_size, cfg.max_files));
    }

    auto l = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    l->set_level(level);
    l->set_pattern(cfg.pattern);
    l->flush_on(spdlog::level::warn);

    spdlog::drop(kLoggerName);
    spdlog::register_logger(l);
    std::atomic_store(&current(), l);
    return l;
} catch (const spdlog::spdlog_ex& err) {
    return galley_detail::unexpected(std::string{"failed to create logger: "} + err.what());
}

void shutdown_logging() {
    logger()->flush();
    spdlog::shutdown();
}

} // namespace galley::obs
