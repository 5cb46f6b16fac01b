#include "frame_codec.hpp"

#include <agentmux/errors.hpp>

namespace agentmux
{
namespace protocol
{

namespace
{

std::vector<ContentBlock> parse_content_array(const json& message,
                                              std::optional<ContentBlock> (*parse)(const json&))
{
    std::vector<ContentBlock> blocks;
    if (!message.contains("content") || !message["content"].is_array())
        return blocks;

    for (const auto& content_json : message["content"])
        if (auto block = parse(content_json))
            blocks.push_back(std::move(*block));
    return blocks;
}

// The CLI wraps the actual message in a "message" field
const json& inner_message(const json& j)
{
    if (j.contains("message") && j["message"].is_object())
        return j["message"];
    return j;
}

} // namespace

MessageParser::MessageParser(size_t max_frame_size) : max_frame_size_(max_frame_size) {}

Message MessageParser::parse_message(const std::string& json_str)
{
    json j;
    try
    {
        j = json::parse(json_str);
    }
    catch (const json::exception& e)
    {
        throw ProtocolDecodeError(std::string("JSON parse error: ") + e.what());
    }
    return parse_frame(j);
}

Message MessageParser::parse_frame(const json& j)
{
    if (!j.is_object())
        throw ProtocolDecodeError("Frame is not a JSON object", j);
    if (!j.contains("type") || !j["type"].is_string())
        throw ProtocolDecodeError("Frame has no string 'type' field", j);

    try
    {
        std::string type = j["type"].get<std::string>();

        if (type == "assistant")
            return parse_assistant_message(j);
        else if (type == "result")
            return parse_result_message(j);
        else if (type == "system")
            return parse_system_message(j);
        else if (type == "stream_event" || type == "stream")
            return parse_stream_event(j);
        else if (type == "user")
            return parse_user_message(j);
        else if (type == "control_request")
            return parse_control_request(j);
        else if (type == "control_response")
            return parse_control_response(j);

        // Forward compatibility: keep frames of types we do not know yet
        return UnknownMessage{type, j};
    }
    catch (const json::exception& e)
    {
        throw ProtocolDecodeError(std::string("Invalid frame: ") + e.what(), j);
    }
}

std::vector<DecodedFrame> MessageParser::add_data(const std::string& data)
{
    bool had_partial = !buffer_.empty();
    bool consumed_line = false;
    buffer_ += data;

    std::vector<DecodedFrame> frames;

    while (!buffer_.empty())
    {
        size_t pos = buffer_.find('\n');

        if (discarding_)
        {
            if (pos == std::string::npos)
            {
                buffer_.clear();
                break;
            }
            buffer_.erase(0, pos + 1);
            discarding_ = false;
            consumed_line = true;
            continue;
        }

        if (pos == std::string::npos)
        {
            if (buffer_.size() > max_frame_size_)
            {
                frames.push_back(error_frame("Frame exceeds maximum size of " +
                                                 std::to_string(max_frame_size_) + " bytes",
                                             buffer_.size()));
                buffer_.clear();
                discarding_ = true;
            }
            break;
        }

        consumed_line = true;

        if (pos > max_frame_size_)
        {
            frames.push_back(error_frame("Frame exceeds maximum size of " +
                                             std::to_string(max_frame_size_) + " bytes",
                                         pos + 1));
            buffer_.erase(0, pos + 1);
            continue;
        }

        std::string line = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);

        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.find_first_not_of(" \t\r") == std::string::npos)
            continue;

        DecodedFrame frame = decode_line(line);
        frame.size = pos + 1;
        frames.push_back(std::move(frame));
    }

    if (!buffer_.empty() && (!had_partial || consumed_line))
        partial_since_ = std::chrono::steady_clock::now();

    return frames;
}

std::optional<DecodedFrame> MessageParser::expire_partial(std::chrono::milliseconds max_age)
{
    if (buffer_.empty())
        return std::nullopt;

    if (std::chrono::steady_clock::now() - partial_since_ < max_age)
        return std::nullopt;

    size_t size = buffer_.size();
    buffer_.clear();
    // The rest of this frame, when it arrives, belongs to the dropped one
    discarding_ = true;
    return error_frame("Incomplete frame timed out after " + std::to_string(max_age.count()) +
                           " ms",
                       size);
}

DecodedFrame MessageParser::decode_line(const std::string& line)
{
    DecodedFrame frame;
    try
    {
        frame.raw = json::parse(line);
    }
    catch (const json::exception& e)
    {
        frame.error = std::string("JSON parse error: ") + e.what();
        return frame;
    }

    try
    {
        frame.message = parse_frame(frame.raw);
    }
    catch (const ProtocolDecodeError& e)
    {
        frame.error = e.what();
    }
    return frame;
}

DecodedFrame MessageParser::error_frame(std::string error, size_t size)
{
    DecodedFrame frame;
    frame.error = std::move(error);
    frame.size = size;
    return frame;
}

std::optional<ContentBlock> MessageParser::parse_content_block(const json& j)
{
    std::string type = j.at("type").get<std::string>();

    if (type == "text")
    {
        TextBlock block;
        block.text = j.at("text").get<std::string>();
        return block;
    }
    else if (type == "thinking")
    {
        ThinkingBlock block;
        block.thinking = j.at("thinking").get<std::string>();
        if (j.contains("signature") && j["signature"].is_string())
            block.signature = j["signature"].get<std::string>();
        return block;
    }
    else if (type == "tool_use")
    {
        ToolUseBlock block;
        block.id = j.at("id").get<std::string>();
        block.name = j.at("name").get<std::string>();
        block.input = j.value("input", json::object());
        return block;
    }
    else if (type == "tool_result")
    {
        ToolResultBlock block;
        block.tool_use_id = j.at("tool_use_id").get<std::string>();
        if (j.contains("is_error") && j["is_error"].is_boolean())
            block.is_error = j["is_error"].get<bool>();
        // Content can be: string, array of content blocks, or null
        block.content = j.contains("content") ? j["content"] : json(nullptr);
        return block;
    }

    // Unknown block types stay visible through the raw frame
    return std::nullopt;
}

AssistantMessage MessageParser::parse_assistant_message(const json& j)
{
    AssistantMessage msg;
    msg.raw_json = j;

    const auto& message = inner_message(j);
    msg.content = parse_content_array(message, &MessageParser::parse_content_block);

    if (message.contains("model") && message["model"].is_string())
        msg.model = message["model"].get<std::string>();

    // Error field lives on the outer object
    if (j.contains("error") && j["error"].is_string())
        msg.error = j["error"].get<std::string>();

    return msg;
}

UserMessage MessageParser::parse_user_message(const json& j)
{
    UserMessage msg;
    msg.raw_json = j;

    const auto& message = inner_message(j);
    if (message.contains("content") && message["content"].is_string())
        msg.content.push_back(TextBlock{"text", message["content"].get<std::string>()});
    else
        msg.content = parse_content_array(message, &MessageParser::parse_content_block);

    return msg;
}

ResultMessage MessageParser::parse_result_message(const json& j)
{
    ResultMessage msg;
    msg.raw_json = j;

    msg.subtype = j.value("subtype", "");
    msg.session_id = j.value("session_id", "");

    if (j.contains("usage") && j["usage"].is_object())
    {
        const auto& usage = j["usage"];
        msg.usage.input_tokens = usage.value("input_tokens", 0);
        msg.usage.output_tokens = usage.value("output_tokens", 0);
        msg.usage.cache_creation_input_tokens = usage.value("cache_creation_input_tokens", 0);
        msg.usage.cache_read_input_tokens = usage.value("cache_read_input_tokens", 0);
    }

    if (j.contains("total_cost_usd") && j["total_cost_usd"].is_number())
        msg.total_cost_usd = j["total_cost_usd"].get<double>();

    msg.duration_ms = j.value("duration_ms", 0);
    msg.duration_api_ms = j.value("duration_api_ms", 0);
    msg.num_turns = j.value("num_turns", 0);
    msg.is_error = j.value("is_error", false);

    if (j.contains("result") && j["result"].is_string())
        msg.result = j["result"].get<std::string>();

    return msg;
}

SystemMessage MessageParser::parse_system_message(const json& j)
{
    SystemMessage msg;
    msg.raw_json = j;

    // Content is optional - system messages with subtype="init" don't have content
    if (j.contains("content"))
    {
        if (j["content"].is_string())
            msg.content = j["content"].get<std::string>();
        else
            msg.content = j["content"].dump();
    }

    if (j.contains("subtype") && j["subtype"].is_string())
        msg.subtype = j["subtype"].get<std::string>();
    return msg;
}

StreamEvent MessageParser::parse_stream_event(const json& j)
{
    StreamEvent event;
    event.raw_json = j;

    // Two formats:
    // 1. Nested: {"type":"stream_event","event":{"type":"content_block_delta",...}}
    // 2. Flat: {"type":"stream","event":"content_block_delta","index":0}
    if (!j.contains("event"))
        throw ProtocolDecodeError("stream event message missing 'event' field", j);

    if (j["event"].is_object())
    {
        const auto& event_obj = j["event"];
        event.event = event_obj.at("type").get<std::string>();
        event.index = event_obj.value("index", 0);
        event.data = event_obj;
    }
    else if (j["event"].is_string())
    {
        event.event = j["event"].get<std::string>();
        event.index = j.value("index", 0);
        event.data = (j.contains("data") && j["data"].is_object()) ? j["data"] : j;
    }
    else
    {
        throw ProtocolDecodeError("stream event 'event' field must be object or string", j);
    }

    if (j.contains("uuid") && j["uuid"].is_string())
        event.uuid = j["uuid"].get<std::string>();
    if (j.contains("session_id") && j["session_id"].is_string())
        event.session_id = j["session_id"].get<std::string>();
    if (j.contains("parent_tool_use_id") && j["parent_tool_use_id"].is_string())
        event.parent_tool_use_id = j["parent_tool_use_id"].get<std::string>();

    return event;
}

ControlRequest MessageParser::parse_control_request(const json& j)
{
    ControlRequest msg;
    msg.request_id = j.at("request_id").get<std::string>();
    msg.request = j.at("request");
    if (!msg.request.is_object())
        throw ProtocolDecodeError("control_request 'request' must be an object", j);
    return msg;
}

ControlResponse MessageParser::parse_control_response(const json& j)
{
    ControlResponse msg;
    const auto& response = j.at("response");
    msg.response.subtype = response.at("subtype").get<std::string>();
    msg.response.request_id = response.at("request_id").get<std::string>();

    // Response data is optional (might be null for error case)
    if (response.contains("response") && !response["response"].is_null())
        msg.response.response = response["response"];

    // Error message is optional (only present on error)
    if (response.contains("error") && response["error"].is_string())
        msg.response.error = response["error"].get<std::string>();

    return msg;
}

} // namespace protocol
} // namespace agentmux
