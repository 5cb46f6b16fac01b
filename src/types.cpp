#include <agentmux/types.hpp>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace agentmux
{

namespace
{

bool has_block(const std::vector<ContentBlock>& content, bool tool_use)
{
    for (const auto& block : content)
    {
        if (tool_use && std::holds_alternative<ToolUseBlock>(block))
            return true;
        if (!tool_use && std::holds_alternative<ToolResultBlock>(block))
            return true;
    }
    return false;
}

struct KindVisitor
{
    MessageKind operator()(const AssistantMessage& msg) const
    {
        return has_block(msg.content, true) ? MessageKind::ToolUse : MessageKind::Assistant;
    }
    MessageKind operator()(const UserMessage& msg) const
    {
        return has_block(msg.content, false) ? MessageKind::ToolResult : MessageKind::User;
    }
    MessageKind operator()(const SystemMessage&) const
    {
        return MessageKind::System;
    }
    MessageKind operator()(const ResultMessage&) const
    {
        return MessageKind::Result;
    }
    MessageKind operator()(const StreamEvent&) const
    {
        return MessageKind::StreamEvent;
    }
    MessageKind operator()(const protocol::ControlRequest&) const
    {
        return MessageKind::ControlRequest;
    }
    MessageKind operator()(const protocol::ControlResponse&) const
    {
        return MessageKind::ControlResponse;
    }
    MessageKind operator()(const UnknownMessage&) const
    {
        return MessageKind::Unknown;
    }
};

} // namespace

const char* to_string(MessageKind kind)
{
    switch (kind)
    {
    case MessageKind::Assistant:
        return "assistant";
    case MessageKind::User:
        return "user";
    case MessageKind::ToolUse:
        return "tool_use";
    case MessageKind::ToolResult:
        return "tool_result";
    case MessageKind::ControlRequest:
        return "control_request";
    case MessageKind::ControlResponse:
        return "control_response";
    case MessageKind::System:
        return "system";
    case MessageKind::Result:
        return "result";
    case MessageKind::StreamEvent:
        return "stream_event";
    case MessageKind::Unknown:
        return "unknown";
    }
    return "unknown";
}

MessageKind classify(const Message& message)
{
    return std::visit(KindVisitor{}, message);
}

json BufferedMessage::to_json() const
{
    return {{"seq", seq},
            {"timestamp", format_timestamp(timestamp)},
            {"kind", to_string(kind)},
            {"payload", raw}};
}

json permission_result_to_json(const PermissionResult& result, const json& original_input)
{
    json response_data;

    if (std::holds_alternative<PermissionResultAllow>(result))
    {
        const auto& allow = std::get<PermissionResultAllow>(result);
        response_data["behavior"] = allow.behavior;

        // Add updatedInput if provided, otherwise use original input
        if (allow.updated_input.has_value())
            response_data["updatedInput"] = *allow.updated_input;
        else
            response_data["updatedInput"] = original_input;
    }
    else
    {
        const auto& deny = std::get<PermissionResultDeny>(result);
        response_data["behavior"] = deny.behavior;
        response_data["message"] = deny.message;

        if (deny.interrupt)
            response_data["interrupt"] = deny.interrupt;
    }

    return response_data;
}

std::string get_text_content(const std::vector<ContentBlock>& content)
{
    std::string result;

    for (const auto& block : content)
    {
        if (auto* text_block = std::get_if<TextBlock>(&block))
        {
            result += text_block->text;
        }
    }

    return result;
}

std::vector<std::string> extract_last_output_lines(const std::vector<BufferedMessage>& messages,
                                                   size_t n)
{
    std::vector<std::string> lines;

    for (auto it = messages.rbegin(); it != messages.rend() && lines.size() < n; ++it)
    {
        const auto* assistant = std::get_if<AssistantMessage>(&it->message);
        if (!assistant)
            continue;

        for (const auto& block : assistant->content)
        {
            if (lines.size() >= n)
                break;
            if (auto* text = std::get_if<TextBlock>(&block))
                lines.push_back(text->text);
            else if (auto* thinking = std::get_if<ThinkingBlock>(&block))
                lines.push_back(thinking->thinking);
        }
    }

    return lines;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp)
{
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() %
        1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis << 'Z';
    return oss.str();
}

} // namespace agentmux
