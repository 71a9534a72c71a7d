#ifndef AGENTRT_COMMON_LOGGING_LOGGER_H
#define AGENTRT_COMMON_LOGGING_LOGGER_H

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace agentrt {

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%n] %v";
};

// Installs the "agentrt" logger. AGENTRT_LOG_LEVEL / AGENTRT_LOG_PATTERN in the
// environment win over the config.
void init_logging(const LoggingConfig& config = {});

// Lazily creates the logger with defaults if init_logging was never called
std::shared_ptr<spdlog::logger> get_logger();

} // namespace agentrt

#define AGENTRT_LOG_DEBUG(...) ::agentrt::get_logger()->debug(__VA_ARGS__)
#define AGENTRT_LOG_INFO(...) ::agentrt::get_logger()->info(__VA_ARGS__)
#define AGENTRT_LOG_WARN(...) ::agentrt::get_logger()->warn(__VA_ARGS__)
#define AGENTRT_LOG_ERROR(...) ::agentrt::get_logger()->error(__VA_ARGS__)

#endif // AGENTRT_COMMON_LOGGING_LOGGER_H
