#ifndef AGENTMUX_LOGGING_HPP
#define AGENTMUX_LOGGING_HPP

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace agentmux
{

// Shared "agentmux" logger, created on first use (stderr, colored)
std::shared_ptr<spdlog::logger> logger();

// Create the logger with an explicit level and pattern
void init_logging(spdlog::level::level_enum level = spdlog::level::info);

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse "trace", "debug", "info", "warn", "error", "critical", "off"
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace agentmux

#endif // AGENTMUX_LOGGING_HPP
