#ifndef AGENTMUX_INTERNAL_FRAME_CODEC_HPP
#define AGENTMUX_INTERNAL_FRAME_CODEC_HPP

#include <agentmux/types.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace agentmux
{
namespace protocol
{

// Incremental decoder for newline-delimited JSON frames
class MessageParser
{
  public:
    explicit MessageParser(size_t max_frame_size = 1024 * 1024);

    // Parse one complete frame; throws ProtocolDecodeError
    static Message parse_message(const std::string& json_str);
    static Message parse_frame(const json& j);

    // Append bytes and decode every completed frame, in order
    std::vector<DecodedFrame> add_data(const std::string& data);

    // Drop an incomplete frame that has been pending for at least max_age
    std::optional<DecodedFrame> expire_partial(std::chrono::milliseconds max_age);

    // Check if buffer has buffered data
    bool has_buffered_data() const
    {
        return !buffer_.empty();
    }

    // Clear buffer
    void clear_buffer()
    {
        buffer_.clear();
        discarding_ = false;
    }

  private:
    std::string buffer_;
    size_t max_frame_size_;
    bool discarding_ = false; // Skipping an oversize frame up to the next newline
    std::chrono::steady_clock::time_point partial_since_;

    static DecodedFrame decode_line(const std::string& line);
    static DecodedFrame error_frame(std::string error, size_t size);

    // Parse content block from JSON; nullopt for unrecognized block types
    static std::optional<ContentBlock> parse_content_block(const json& j);

    // Parse specific message types
    static AssistantMessage parse_assistant_message(const json& j);
    static UserMessage parse_user_message(const json& j);
    static ResultMessage parse_result_message(const json& j);
    static SystemMessage parse_system_message(const json& j);
    static StreamEvent parse_stream_event(const json& j);
    static ControlRequest parse_control_request(const json& j);
    static ControlResponse parse_control_response(const json& j);
};

} // namespace protocol
} // namespace agentmux

#endif // AGENTMUX_INTERNAL_FRAME_CODEC_HPP
