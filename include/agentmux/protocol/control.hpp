#ifndef AGENTMUX_PROTOCOL_CONTROL_HPP
#define AGENTMUX_PROTOCOL_CONTROL_HPP

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

namespace agentmux
{

// JSON type alias (also defined in types.hpp)
// Duplicate declaration needed here since control.hpp can't include types.hpp (circular dependency)
using json = nlohmann::json;

/// Prompt given to a session: plain text, or structured user turns.
/// Each structured turn is a full `{"type":"user",...}` frame, a `{"role","content"}`
/// message object, or a content value (string or content-block array).
using PromptInput = std::variant<std::string, std::vector<json>>;

namespace protocol
{

// Control request - exchanged in both directions
struct ControlRequest
{
    std::string type = "control_request";
    std::string request_id;
    json request; // Subtype-specific data, always carries "subtype"

    std::string subtype() const
    {
        if (request.is_object() && request.contains("subtype") && request["subtype"].is_string())
            return request["subtype"].get<std::string>();
        return "";
    }
};

// Control response - answer to a control request
struct ControlResponse
{
    std::string type = "control_response";
    struct Response
    {
        std::string subtype; // "success" or "error"
        std::string request_id;
        json response;     // Response data
        std::string error; // Error message if failed
    } response;
};

// ============================================================================
// Outbound commands (host -> peer)
// ============================================================================

/// Session configuration, sent once after launch
struct InitCommand
{
    std::string request_id;
    json hooks = nullptr;
    json agents = nullptr;
};

/// New user input
struct PromptCommand
{
    PromptInput prompt;
    std::string session_id = "default";
};

/// Cancel the in-flight turn
struct InterruptCommand
{
    std::string request_id;
};

/// Answer to a peer-issued control request
struct ControlResponseCommand
{
    std::string request_id;
    bool success = true;
    json response = json::object();
    std::string error;
};

using Command = std::variant<InitCommand, PromptCommand, InterruptCommand, ControlResponseCommand>;

/// Serialize a command into newline-terminated frames.
/// Structured prompts produce one frame per turn.
std::string encode(const Command& command);

// Control protocol manager - handles async request/response correlation
class ControlProtocol
{
  public:
    ControlProtocol();
    ~ControlProtocol();

    // No copy
    ControlProtocol(const ControlProtocol&) = delete;
    ControlProtocol& operator=(const ControlProtocol&) = delete;

    // Generate unique request ID
    std::string generate_request_id();

    // Register a pending request and return future
    std::future<json> register_request(const std::string& request_id);

    // Wait for a registered request; throws TimeoutError, or AgentmuxError on peer error
    json wait_for_response(std::future<json>& future, const std::string& request_id,
                           const std::string& subtype, std::chrono::milliseconds timeout);

    // Handle incoming control response; returns false if nothing was waiting for it
    bool handle_response(const ControlResponse& response);

    // Drop a pending request without resolving it
    void cancel_request(const std::string& request_id);

    // Reject every pending request (peer went away)
    void fail_all_pending(const std::string& error);

    size_t pending_count() const;

  private:
    std::atomic<int> request_counter_{0};

    // Pending requests - maps request_id to promise
    std::map<std::string, std::promise<json>> pending_requests_;
    mutable std::mutex requests_mutex_;

    // Resolve a pending request with success
    bool resolve_request(const std::string& request_id, const json& data);

    // Reject a pending request with error
    bool reject_request(const std::string& request_id, const std::string& error);
};

} // namespace protocol
} // namespace agentmux

#endif // AGENTMUX_PROTOCOL_CONTROL_HPP
