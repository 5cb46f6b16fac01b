#include <agentmux/config.hpp>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <fstream>
#include <stdexcept>
#include <type_traits>

namespace agentmux
{

namespace
{

// Integer fields must hold the JSON value exactly; get<T>() would wrap or truncate
template <typename T>
T read_integer(const json& value, const char* key)
{
    if (!value.is_number_integer())
        throw std::invalid_argument(std::string("'") + key + "' must be an integer");

    constexpr auto max_value = static_cast<uint64_t>(std::numeric_limits<T>::max());
    bool in_range;
    if (value.is_number_unsigned())
    {
        in_range = value.get<uint64_t>() <= max_value;
    }
    else
    {
        auto v = value.get<int64_t>();
        in_range = v >= 0 ? static_cast<uint64_t>(v) <= max_value
                          : std::is_signed<T>::value &&
                                v >= static_cast<int64_t>(std::numeric_limits<T>::min());
    }

    if (!in_range)
        throw std::invalid_argument(std::string("'") + key + "' is out of range: " + value.dump());
    return value.get<T>();
}

template <typename T>
void read_field(const json& j, const char* key, T& out)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return;

    if constexpr (std::is_integral<T>::value && !std::is_same<T, bool>::value)
    {
        out = read_integer<T>(*it, key);
    }
    else
    {
        try
        {
            out = it->get<T>();
        }
        catch (const json::exception& e)
        {
            throw std::invalid_argument(std::string("Invalid value for '") + key +
                                        "': " + e.what());
        }
    }
}

void read_millis(const json& j, const char* key, std::chrono::milliseconds& out)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return;

    if (!it->is_number_integer() || it->get<long long>() < 0)
        throw std::invalid_argument(std::string("'") + key +
                                    "' must be a non-negative integer (milliseconds)");
    out = std::chrono::milliseconds(it->get<long long>());
}

long long env_integer(const char* name, long long min_value)
{
    const char* value = std::getenv(name);
    long long parsed = 0;
    size_t consumed = 0;
    try
    {
        parsed = std::stoll(value, &consumed);
    }
    catch (const std::exception&)
    {
        throw std::invalid_argument(std::string(name) + " is not an integer: " + value);
    }
    if (consumed != std::string(value).size() || parsed < min_value)
        throw std::invalid_argument(std::string(name) + " is out of range: " + value);
    return parsed;
}

} // namespace

SpawnOptions SpawnOptions::from_json(const json& j)
{
    SpawnOptions options;
    if (j.is_null())
        return options;
    if (!j.is_object())
        throw std::invalid_argument("spawn options must be a JSON object");

    read_field(j, "max_turns", options.max_turns);
    read_field(j, "system_prompt", options.system_prompt);
    read_field(j, "append_system_prompt", options.append_system_prompt);
    read_field(j, "allowed_tools", options.allowed_tools);
    read_field(j, "disallowed_tools", options.disallowed_tools);
    read_field(j, "model", options.model);
    read_field(j, "add_dirs", options.add_dirs);
    read_field(j, "environment", options.environment);
    read_field(j, "permission_mode", options.permission_mode);
    read_field(j, "label", options.label);
    read_field(j, "worker_count", options.worker_count);

    std::string working_directory;
    read_field(j, "working_directory", working_directory);
    if (!working_directory.empty())
        options.working_directory = working_directory;

    // extra_args: {"flag": "value"} or {"flag": null|true} for boolean flags
    auto extra = j.find("extra_args");
    if (extra != j.end() && !extra->is_null())
    {
        if (!extra->is_object())
            throw std::invalid_argument("'extra_args' must be an object");

        for (const auto& [flag, value] : extra->items())
        {
            if (value.is_string())
                options.extra_args[flag] = value.get<std::string>();
            else if (value.is_null() || (value.is_boolean() && value.get<bool>()))
                options.extra_args[flag] = "";
            else if (value.is_number())
                options.extra_args[flag] = value.dump();
            else
                throw std::invalid_argument("Invalid value for extra arg '" + flag + "'");
        }
    }

    return options;
}

ManagerConfig ManagerConfig::from_json(const json& j)
{
    if (!j.is_object())
        throw std::invalid_argument("config must be a JSON object");

    ManagerConfig config;

    read_field(j, "executable", config.executable);
    read_field(j, "allowed_executable_paths", config.allowed_executable_paths);

    std::string sha256;
    read_field(j, "executable_sha256", sha256);
    if (!sha256.empty())
        config.executable_sha256 = sha256;

    read_field(j, "max_sessions", config.max_sessions);
    read_field(j, "max_workers_per_spawn", config.max_workers_per_spawn);
    read_field(j, "max_turns_ceiling", config.max_turns_ceiling);
    read_field(j, "buffer_capacity", config.buffer_capacity);
    read_field(j, "buffer_max_bytes", config.buffer_max_bytes);
    read_field(j, "max_frame_bytes", config.max_frame_bytes);
    read_field(j, "max_pending_writes", config.max_pending_writes);
    read_field(j, "log_level", config.log_level);

    read_millis(j, "io_timeout_ms", config.io_timeout);
    read_millis(j, "grace_period_ms", config.grace_period);
    read_millis(j, "control_timeout_ms", config.control_timeout);
    read_millis(j, "retention_ms", config.retention);
    read_millis(j, "cleanup_interval_ms", config.cleanup_interval);
    read_millis(j, "working_threshold_ms", config.working_threshold);

    auto env = j.find("environment");
    if (env != j.end() && !env->is_null())
    {
        if (!env->is_object())
            throw std::invalid_argument("'environment' must be an object");
        read_field(*env, "inherited", config.environment.inherited);
        read_field(*env, "denied", config.environment.denied);
        read_field(*env, "denied_prefixes", config.environment.denied_prefixes);
        read_field(*env, "fixed", config.environment.fixed);
    }

    auto args = j.find("allowed_flags");
    if (args != j.end() && !args->is_null())
    {
        if (!args->is_object())
            throw std::invalid_argument("'allowed_flags' must be an object of flag -> bool");
        config.arguments.allowed_flags.clear();
        for (const auto& [flag, takes_value] : args->items())
        {
            if (!takes_value.is_boolean())
                throw std::invalid_argument("allowed flag '" + flag + "' must map to a bool");
            config.arguments.allowed_flags[flag] = takes_value.get<bool>();
        }
    }

    if (config.buffer_capacity == 0)
        throw std::invalid_argument("'buffer_capacity' must be at least 1");
    if (config.max_pending_writes == 0)
        throw std::invalid_argument("'max_pending_writes' must be at least 1");

    return config;
}

ManagerConfig load_config_file(const std::string& path)
{
    std::ifstream file(path);
    if (!file)
        throw std::invalid_argument("Cannot open config file: " + path);

    json j;
    try
    {
        j = json::parse(file);
    }
    catch (const json::exception& e)
    {
        throw std::invalid_argument("Invalid JSON in config file " + path + ": " + e.what());
    }

    return ManagerConfig::from_json(j);
}

void apply_environment_overrides(ManagerConfig& config)
{
    if (const char* cli = std::getenv("AGENTMUX_CLI_PATH"))
        config.executable = cli;

    if (std::getenv("AGENTMUX_MAX_SESSIONS"))
        config.max_sessions = static_cast<size_t>(env_integer("AGENTMUX_MAX_SESSIONS", 1));

    if (std::getenv("AGENTMUX_IO_TIMEOUT_MS"))
        config.io_timeout = std::chrono::milliseconds(env_integer("AGENTMUX_IO_TIMEOUT_MS", 1));

    if (std::getenv("AGENTMUX_GRACE_MS"))
        config.grace_period = std::chrono::milliseconds(env_integer("AGENTMUX_GRACE_MS", 0));

    if (std::getenv("AGENTMUX_RETENTION_MS"))
        config.retention = std::chrono::milliseconds(env_integer("AGENTMUX_RETENTION_MS", 0));

    if (const char* level = std::getenv("AGENTMUX_LOG_LEVEL"))
        config.log_level = level;
}

} // namespace agentmux
