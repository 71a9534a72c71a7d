#include "common/logging/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <mutex>

namespace agentrt {

namespace {

constexpr const char* kLoggerName = "agentrt";

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::string resolve_level(const LoggingConfig& config) {
    if (const char* level = std::getenv("AGENTRT_LOG_LEVEL")) {
        return level;
    }
    return config.level.empty() ? "info" : config.level;
}

std::string resolve_pattern(const LoggingConfig& config) {
    if (const char* pattern = std::getenv("AGENTRT_LOG_PATTERN")) {
        return pattern;
    }
    return config.pattern.empty() ? LoggingConfig{}.pattern : config.pattern;
}

std::shared_ptr<spdlog::logger> make_logger(const LoggingConfig& config) {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stdout_color_mt(kLoggerName);
    }
    logger->set_pattern(resolve_pattern(config));
    logger->set_level(spdlog::level::from_str(resolve_level(config)));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

} // namespace

void init_logging(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_logger = make_logger(config);
}

std::shared_ptr<spdlog::logger> get_logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        g_logger = make_logger(LoggingConfig{});
    }
    return g_logger;
}

} // namespace agentrt
