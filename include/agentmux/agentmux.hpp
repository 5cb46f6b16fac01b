#ifndef AGENTMUX_HPP
#define AGENTMUX_HPP

// Main header that includes everything

#include <agentmux/config.hpp>
#include <agentmux/errors.hpp>
#include <agentmux/logging.hpp>
#include <agentmux/manager.hpp>
#include <agentmux/message_buffer.hpp>
#include <agentmux/session.hpp>
#include <agentmux/transport.hpp>
#include <agentmux/types.hpp>
#include <agentmux/version.hpp>

#endif // AGENTMUX_HPP
