#ifndef AGENTMUX_CONFIG_HPP
#define AGENTMUX_CONFIG_HPP

#include <agentmux/transport.hpp>
#include <agentmux/types.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agentmux
{

/// Which host variables reach a child, and which overrides are refused
struct EnvironmentPolicy
{
    // Host variables copied into the child environment when set
    std::vector<std::string> inherited = {"PATH", "HOME", "USER",   "LOGNAME", "TMPDIR", "TEMP",
                                          "TMP",  "LANG", "LC_ALL", "TERM",    "SHELL"};

    // Overrides that fail the spawn
    std::vector<std::string> denied = {"LD_PRELOAD",      "LD_LIBRARY_PATH", "DYLD_INSERT_LIBRARIES",
                                       "DYLD_LIBRARY_PATH", "PATH",          "NODE_OPTIONS",
                                       "PYTHONPATH",      "PERL5LIB",        "RUBYLIB"};

    // Any override starting with one of these also fails the spawn
    std::vector<std::string> denied_prefixes = {"LD_", "DYLD_"};

    // Fixed variables set on every child (after overrides)
    std::map<std::string, std::string> fixed;
};

/// Extra command-line flags callers may pass through
struct ArgumentPolicy
{
    // Flag name (without leading dashes) -> whether it takes a value
    std::map<std::string, bool> allowed_flags = {
        {"timeout", true}, {"retries", true}, {"log-level", true}, {"cache-dir", true}};
};

/// Per-spawn request options
struct SpawnOptions
{
    int max_turns = 10;
    std::string system_prompt;
    std::string append_system_prompt; // Mutually exclusive with system_prompt; wins if both set
    std::vector<std::string> allowed_tools;
    std::vector<std::string> disallowed_tools;
    std::string model;
    std::optional<std::string> working_directory;
    std::vector<std::string> add_dirs;
    std::map<std::string, std::string> environment; // Filtered by EnvironmentPolicy
    std::string permission_mode; // "default", "acceptEdits", "plan", "bypassPermissions"
    std::string label;           // Sessions are named "<label>-<n>", or "Agent-<n>"
    int worker_count = 1;        // Identical sessions to start for this request

    /// Arbitrary CLI flags to pass through, checked against ArgumentPolicy
    /// Maps flag name -> value (or empty string for boolean flags)
    std::map<std::string, std::string> extra_args;

    /// Parse the "options" object of a spawn request. Throws std::invalid_argument.
    static SpawnOptions from_json(const json& j);
};

/// Registry-wide configuration
struct ManagerConfig
{
    // Executable name (searched in PATH) or path
    std::string executable = "claude";

    // If non-empty, the resolved executable must be one of these
    std::vector<std::string> allowed_executable_paths;

    // Optional SHA-256 pin of the executable (64 hex chars)
    std::optional<std::string> executable_sha256;

    EnvironmentPolicy environment;
    ArgumentPolicy arguments;

    size_t max_sessions = 10;         // Concurrent non-terminal sessions
    size_t max_workers_per_spawn = 10;
    int max_turns_ceiling = 1000;

    size_t buffer_capacity = 1000;         // Messages retained per session
    size_t buffer_max_bytes = 1024 * 1024; // Payload bytes retained per session
    size_t max_frame_bytes = 1024 * 1024;  // Longest accepted inbound frame
    size_t max_pending_writes = 64;        // Queued outbound frames per session

    std::chrono::milliseconds io_timeout{30000};
    std::chrono::milliseconds grace_period{5000};
    std::chrono::milliseconds control_timeout{30000}; // Host control requests (interrupt)
    std::chrono::milliseconds retention{60000};        // Terminal sessions kept this long
    std::chrono::milliseconds cleanup_interval{60000}; // Zero disables the cleanup thread
    std::chrono::milliseconds working_threshold{2000}; // Recent activity counts as working

    /// Level for init_logging; the application applies it, SessionManager does not
    std::string log_level = "info";

    /// Answers `can_use_tool` requests; default policy uses the session's tool lists
    std::optional<ToolPermissionCallback> permission_callback;

    /// Creates transports; defaults to create_subprocess_transport
    TransportFactory transport_factory;

    /// Build from a JSON object. Unknown keys are ignored; wrong types throw
    /// std::invalid_argument.
    static ManagerConfig from_json(const json& j);
};

/// Load a JSON config file. Throws std::invalid_argument on unreadable or invalid files.
ManagerConfig load_config_file(const std::string& path);

/// Apply AGENTMUX_* environment variables on top of a config
void apply_environment_overrides(ManagerConfig& config);

} // namespace agentmux

#endif // AGENTMUX_CONFIG_HPP
