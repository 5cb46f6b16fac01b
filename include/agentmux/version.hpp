#ifndef AGENTMUX_VERSION_HPP
#define AGENTMUX_VERSION_HPP

#include <string>

namespace agentmux
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

std::string version_string();

} // namespace agentmux

#endif // AGENTMUX_VERSION_HPP
