#include <agentmux/logging.hpp>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace agentmux
{

namespace
{
constexpr const char* LOGGER_NAME = "agentmux";
std::mutex logger_mutex;

std::shared_ptr<spdlog::logger> create_logger()
{
    auto existing = spdlog::get(LOGGER_NAME);
    if (existing)
        return existing;

    auto created = spdlog::stderr_color_mt(LOGGER_NAME);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v");
    return created;
}
} // namespace

std::shared_ptr<spdlog::logger> logger()
{
    static std::shared_ptr<spdlog::logger> instance;
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (!instance)
        instance = create_logger();
    return instance;
}

void init_logging(spdlog::level::level_enum level)
{
    logger()->set_level(level);
    logger()->flush_on(spdlog::level::warn);
}

void set_log_level(spdlog::level::level_enum level)
{
    logger()->set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name)
{
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off; only accept "off" when asked for explicitly
    if (level == spdlog::level::off && name != "off")
        return spdlog::level::info;
    return level;
}

} // namespace agentmux
