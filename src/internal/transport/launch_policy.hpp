#ifndef AGENTMUX_INTERNAL_TRANSPORT_LAUNCH_POLICY_HPP
#define AGENTMUX_INTERNAL_TRANSPORT_LAUNCH_POLICY_HPP

#include <agentmux/config.hpp>
#include <map>
#include <string>
#include <vector>

namespace agentmux::internal
{

/// True if the policy refuses `name` as a caller override
bool is_denied_variable(const EnvironmentPolicy& policy, const std::string& name);

/// Throws SpawnFailedError if any override is refused or malformed
void validate_environment(const EnvironmentPolicy& policy,
                          const std::map<std::string, std::string>& overrides);

/// Child environment: inherited host variables, then overrides, then fixed variables.
/// Throws SpawnFailedError if an override is refused.
std::map<std::string, std::string>
build_environment(const EnvironmentPolicy& policy,
                  const std::map<std::string, std::string>& overrides);

/// Throws SpawnFailedError for any flag outside the allowlist or a value mismatch
void validate_extra_args(const ArgumentPolicy& policy,
                         const std::map<std::string, std::string>& extra_args);

/// Full command line (after the executable) for a streaming session.
/// Validates extra args first.
std::vector<std::string> build_command(const SpawnOptions& options, const ArgumentPolicy& policy);

/// Resolve and verify the executable. Throws SpawnFailedError.
std::string resolve_executable(const ManagerConfig& config);

} // namespace agentmux::internal

#endif // AGENTMUX_INTERNAL_TRANSPORT_LAUNCH_POLICY_HPP
