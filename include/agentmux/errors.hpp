#ifndef AGENTMUX_ERRORS_HPP
#define AGENTMUX_ERRORS_HPP

#include <cstddef>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace agentmux
{

// Failure categories reported to callers
enum class ErrorKind
{
    SpawnFailed,
    CapacityExceeded,
    SessionNotFound,
    SessionNotActive,
    Timeout,
    ProtocolDecode,
    TransportIo,
    ControlRequest
};

// Base exception
class AgentmuxError : public std::runtime_error
{
  public:
    AgentmuxError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind)
    {
    }

    ErrorKind kind() const
    {
        return kind_;
    }

  private:
    ErrorKind kind_;
};

// Executable missing, not permitted, or launch options rejected
class SpawnFailedError : public AgentmuxError
{
  public:
    explicit SpawnFailedError(const std::string& message)
        : AgentmuxError(ErrorKind::SpawnFailed, message)
    {
    }
};

// Global concurrent-session ceiling reached
class CapacityExceededError : public AgentmuxError
{
  public:
    explicit CapacityExceededError(size_t limit)
        : AgentmuxError(ErrorKind::CapacityExceeded,
                        "Maximum concurrent sessions reached: " + std::to_string(limit)),
          limit_(limit)
    {
    }

    size_t limit() const
    {
        return limit_;
    }

  private:
    size_t limit_;
};

class SessionNotFoundError : public AgentmuxError
{
  public:
    explicit SessionNotFoundError(const std::string& session_id)
        : AgentmuxError(ErrorKind::SessionNotFound, "Session not found: " + session_id),
          session_id_(session_id)
    {
    }

    const std::string& session_id() const
    {
        return session_id_;
    }

  private:
    std::string session_id_;
};

// Operation not permitted on a session in a terminal state
class SessionNotActiveError : public AgentmuxError
{
  public:
    SessionNotActiveError(const std::string& session_id, const std::string& state)
        : AgentmuxError(ErrorKind::SessionNotActive,
                        "Session " + session_id + " is not active (" + state + ")"),
          session_id_(session_id)
    {
    }

    const std::string& session_id() const
    {
        return session_id_;
    }

  private:
    std::string session_id_;
};

class TimeoutError : public AgentmuxError
{
  public:
    explicit TimeoutError(const std::string& message)
        : AgentmuxError(ErrorKind::Timeout, message)
    {
    }
};

// Malformed frame from the peer
class ProtocolDecodeError : public AgentmuxError
{
  public:
    explicit ProtocolDecodeError(const std::string& message)
        : AgentmuxError(ErrorKind::ProtocolDecode, message), data_(nullptr)
    {
    }

    ProtocolDecodeError(const std::string& message, const nlohmann::json& data)
        : AgentmuxError(ErrorKind::ProtocolDecode, message),
          data_(std::make_shared<nlohmann::json>(data))
    {
    }

    // Get the optional data associated with the decode error
    const nlohmann::json* data() const
    {
        return data_.get();
    }

  private:
    std::shared_ptr<nlohmann::json> data_;
};

// Stream read/write failure; fatal to the session
class TransportIoError : public AgentmuxError
{
  public:
    explicit TransportIoError(const std::string& message)
        : AgentmuxError(ErrorKind::TransportIo, message)
    {
    }
};

// Peer answered a host control request with an error, or the request was abandoned
class ControlRequestError : public AgentmuxError
{
  public:
    explicit ControlRequestError(const std::string& message)
        : AgentmuxError(ErrorKind::ControlRequest, message)
    {
    }
};

inline const char* to_string(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::SpawnFailed:
        return "spawn_failed";
    case ErrorKind::CapacityExceeded:
        return "capacity_exceeded";
    case ErrorKind::SessionNotFound:
        return "session_not_found";
    case ErrorKind::SessionNotActive:
        return "session_not_active";
    case ErrorKind::Timeout:
        return "timeout";
    case ErrorKind::ProtocolDecode:
        return "protocol_decode_error";
    case ErrorKind::TransportIo:
        return "transport_io_error";
    case ErrorKind::ControlRequest:
        return "control_request_failed";
    }
    return "unknown";
}

} // namespace agentmux

#endif // AGENTMUX_ERRORS_HPP
