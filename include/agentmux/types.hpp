#ifndef AGENTMUX_TYPES_HPP
#define AGENTMUX_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Include control protocol types (needed for std::variant)
#include <agentmux/protocol/control.hpp>

namespace agentmux
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

// ============================================================================
// Permission Types
// ============================================================================

/// Permission behavior options
namespace PermissionBehavior
{
constexpr const char* Allow = "allow";
constexpr const char* Deny = "deny";
} // namespace PermissionBehavior

/// Context information for tool permission callbacks
struct ToolPermissionContext
{
    std::string session_id;
    std::string permission_mode;
    json suggestions = json::array(); // Permission suggestions sent by the peer, passed through
};

/// Permission result: Allow
struct PermissionResultAllow
{
    std::string behavior = "allow";
    std::optional<json> updated_input = std::nullopt;
};

/// Permission result: Deny
struct PermissionResultDeny
{
    std::string behavior = "deny";
    std::string message = "";
    bool interrupt = false;
};

/// Permission result variant (Allow or Deny)
using PermissionResult = std::variant<PermissionResultAllow, PermissionResultDeny>;

/// Callback invoked when the peer asks to use a tool.
/// @param tool_name Tool name (e.g., "Read", "Write", "Bash")
/// @param input Tool-specific arguments
/// @param context Session and mode of the asking peer
/// @return PermissionResult (allow with optional rewritten input, or deny with message)
using ToolPermissionCallback = std::function<PermissionResult(
    const std::string& tool_name, const json& input, const ToolPermissionContext& context)>;

/// Serialize a verdict into the `can_use_tool` response body
json permission_result_to_json(const PermissionResult& result, const json& original_input);

// ============================================================================
// Message model
// ============================================================================

// Content block types
struct TextBlock
{
    std::string type = "text";
    std::string text;
};

struct ThinkingBlock
{
    std::string type = "thinking";
    std::string thinking;
    std::string signature;
};

struct ToolUseBlock
{
    std::string type = "tool_use";
    std::string id;
    std::string name;
    json input;
};

struct ToolResultBlock
{
    std::string type = "tool_result";
    std::string tool_use_id;
    json content; // Can be string, array of content blocks, or null
    bool is_error = false;
};

// Content block variant
using ContentBlock = std::variant<TextBlock, ThinkingBlock, ToolUseBlock, ToolResultBlock>;

// Message types
struct UserMessage
{
    std::string type = "user";
    std::string role = "user";
    std::vector<ContentBlock> content;
    json raw_json; // Original frame
};

struct AssistantMessage
{
    std::string type = "assistant";
    std::string role = "assistant";
    std::vector<ContentBlock> content;
    std::string model;
    std::optional<std::string> error; // Error category reported by the peer, if any
    json raw_json;
};

struct SystemMessage
{
    std::string type = "system";
    std::string content;
    std::string subtype;
    json raw_json;
};

struct UsageInfo
{
    int input_tokens = 0;
    int output_tokens = 0;
    int cache_creation_input_tokens = 0;
    int cache_read_input_tokens = 0;
};

// Lifecycle "done" frame for one turn
struct ResultMessage
{
    std::string type = "result";
    std::string subtype; // "success" | "error_*"
    std::string session_id;
    UsageInfo usage;
    double total_cost_usd = 0.0;
    int duration_ms = 0;
    int duration_api_ms = 0;
    int num_turns = 0;
    bool is_error = false;
    std::optional<std::string> result;
    json raw_json;
};

struct StreamEvent
{
    std::string type = "stream_event";
    std::string event; // e.g., "content_block_delta"
    int index = 0;
    std::string uuid;
    std::string session_id;
    std::optional<std::string> parent_tool_use_id;
    json data; // Nested event object
    json raw_json;
};

// Well-formed frame whose type is not recognized
struct UnknownMessage
{
    std::string type;
    json raw_json;
};

// Main message variant (includes protocol types)
using Message =
    std::variant<UserMessage, AssistantMessage, SystemMessage, ResultMessage, StreamEvent,
                 protocol::ControlRequest, protocol::ControlResponse, UnknownMessage>;

/// Coarse category of a decoded message
enum class MessageKind
{
    Assistant,
    User,
    ToolUse,    // assistant message carrying tool_use blocks
    ToolResult, // user message carrying tool_result blocks
    ControlRequest,
    ControlResponse,
    System,
    Result,
    StreamEvent,
    Unknown
};

const char* to_string(MessageKind kind);

MessageKind classify(const Message& message);

/// A message as retained by a session's buffer
struct BufferedMessage
{
    uint64_t seq = 0;
    std::chrono::system_clock::time_point timestamp;
    MessageKind kind = MessageKind::Unknown;
    Message message;
    json raw;         // Frame as received
    size_t size = 0;  // Frame size in bytes

    /// {"seq", "timestamp", "kind", "payload"}
    json to_json() const;
};

// Helper functions for type checking
inline bool is_assistant_message(const Message& msg)
{
    return std::holds_alternative<AssistantMessage>(msg);
}

inline bool is_result_message(const Message& msg)
{
    return std::holds_alternative<ResultMessage>(msg);
}

inline bool is_control_request(const Message& msg)
{
    return std::holds_alternative<protocol::ControlRequest>(msg);
}

inline bool is_control_response(const Message& msg)
{
    return std::holds_alternative<protocol::ControlResponse>(msg);
}

// Helper to get text from content blocks
std::string get_text_content(const std::vector<ContentBlock>& content);

/// Text and thinking lines from the newest assistant messages, newest first
std::vector<std::string> extract_last_output_lines(const std::vector<BufferedMessage>& messages,
                                                   size_t n);

/// ISO-8601 UTC with milliseconds
std::string format_timestamp(std::chrono::system_clock::time_point tp);

namespace protocol
{

// Outcome of decoding one frame: a message, or an error for that frame only
struct DecodedFrame
{
    std::optional<Message> message;
    json raw;          // Parsed frame (null if the line was not JSON)
    std::string error; // Set when message is empty
    size_t size = 0;   // Bytes consumed, including the newline

    bool ok() const
    {
        return message.has_value();
    }
};

} // namespace protocol

} // namespace agentmux

#endif // AGENTMUX_TYPES_HPP
