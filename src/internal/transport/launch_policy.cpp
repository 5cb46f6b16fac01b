#include "launch_policy.hpp"

#include "../subprocess/process.hpp"
#include "cli_verification.hpp"

#include <agentmux/errors.hpp>
#include <algorithm>
#include <cstdlib>

namespace agentmux::internal
{

namespace
{

std::string join(const std::vector<std::string>& items, const char* sep)
{
    std::string out;
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (i > 0)
            out += sep;
        out += items[i];
    }
    return out;
}

std::string strip_dashes(const std::string& flag)
{
    size_t start = flag.find_first_not_of('-');
    return start == std::string::npos ? std::string() : flag.substr(start);
}

} // namespace

bool is_denied_variable(const EnvironmentPolicy& policy, const std::string& name)
{
    if (std::find(policy.denied.begin(), policy.denied.end(), name) != policy.denied.end())
        return true;

    for (const auto& prefix : policy.denied_prefixes)
        if (!prefix.empty() && name.compare(0, prefix.size(), prefix) == 0)
            return true;

    return false;
}

void validate_environment(const EnvironmentPolicy& policy,
                          const std::map<std::string, std::string>& overrides)
{
    for (const auto& [name, value] : overrides)
    {
        if (name.empty() || name.find('=') != std::string::npos ||
            name.find('\0') != std::string::npos || value.find('\0') != std::string::npos)
        {
            throw SpawnFailedError("Invalid environment variable: '" + name + "'");
        }

        if (is_denied_variable(policy, name))
            throw SpawnFailedError("Environment variable not permitted: " + name);
    }
}

std::map<std::string, std::string>
build_environment(const EnvironmentPolicy& policy,
                  const std::map<std::string, std::string>& overrides)
{
    validate_environment(policy, overrides);

    std::map<std::string, std::string> env;

    // Add inherited variables that exist in parent environment
    for (const auto& var_name : policy.inherited)
        if (const char* value = std::getenv(var_name.c_str()))
            env[var_name] = value;

    for (const auto& [key, value] : overrides)
        env[key] = value;

    for (const auto& [key, value] : policy.fixed)
        env[key] = value;

    return env;
}

void validate_extra_args(const ArgumentPolicy& policy,
                         const std::map<std::string, std::string>& extra_args)
{
    for (const auto& [flag, value] : extra_args)
    {
        std::string name = strip_dashes(flag);
        auto it = policy.allowed_flags.find(name);
        if (name.empty() || it == policy.allowed_flags.end())
            throw SpawnFailedError("Argument not permitted: " + flag);

        bool takes_value = it->second;
        if (takes_value && value.empty())
            throw SpawnFailedError("Argument --" + name + " requires a value");
        if (!takes_value && !value.empty())
            throw SpawnFailedError("Argument --" + name + " does not take a value");
    }
}

std::vector<std::string> build_command(const SpawnOptions& options, const ArgumentPolicy& policy)
{
    validate_extra_args(policy, options.extra_args);

    std::vector<std::string> args;

    // Streaming JSON in both directions
    args.push_back("--output-format");
    args.push_back("stream-json");
    args.push_back("--input-format");
    args.push_back("stream-json");

    // Required when using stream-json output format
    args.push_back("--verbose");

    // System prompt handling
    // - append_system_prompt extends the default preset
    // - system_prompt replaces it
    // - neither: empty string (CLI requirement for proper parsing)
    if (!options.append_system_prompt.empty())
    {
        args.push_back("--append-system-prompt");
        args.push_back(options.append_system_prompt);
    }
    else
    {
        args.push_back("--system-prompt");
        args.push_back(options.system_prompt);
    }

    if (!options.allowed_tools.empty())
    {
        args.push_back("--allowedTools");
        args.push_back(join(options.allowed_tools, ","));
    }

    if (!options.disallowed_tools.empty())
    {
        args.push_back("--disallowedTools");
        args.push_back(join(options.disallowed_tools, ","));
    }

    args.push_back("--max-turns");
    args.push_back(std::to_string(options.max_turns));

    if (!options.model.empty())
    {
        args.push_back("--model");
        args.push_back(options.model);
    }

    // Permission questions come back over stdio as control requests
    args.push_back("--permission-prompt-tool");
    args.push_back("stdio");

    if (!options.permission_mode.empty())
    {
        args.push_back("--permission-mode");
        args.push_back(options.permission_mode);
    }

    for (const auto& dir : options.add_dirs)
    {
        args.push_back("--add-dir");
        args.push_back(dir);
    }

    // Setting sources (always pass, CLI requires it for proper parsing)
    args.push_back("--setting-sources");
    args.push_back("");

    for (const auto& [flag, value] : options.extra_args)
    {
        args.push_back("--" + strip_dashes(flag));
        if (!value.empty())
            args.push_back(value);
    }

    return args;
}

std::string resolve_executable(const ManagerConfig& config)
{
    auto path = subprocess::find_executable(config.executable);
    if (!path)
        throw SpawnFailedError("Executable not found: " + config.executable);

    if (!verify_cli_path_allowed(*path, config.allowed_executable_paths))
    {
        throw SpawnFailedError("Executable not in allowlist: " + *path +
                               ". Configure allowed_executable_paths.");
    }

    std::string error_msg;
    if (!verify_cli_hash(*path, config.executable_sha256, error_msg))
        throw SpawnFailedError("Executable integrity check failed: " + error_msg);

    return *path;
}

} // namespace agentmux::internal
