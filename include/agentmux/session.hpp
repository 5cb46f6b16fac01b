#ifndef AGENTMUX_SESSION_HPP
#define AGENTMUX_SESSION_HPP

#include <agentmux/config.hpp>
#include <agentmux/message_buffer.hpp>
#include <agentmux/protocol/control.hpp>
#include <agentmux/transport.hpp>
#include <agentmux/types.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agentmux
{

/// Session lifecycle. Completed, Failed and Terminated are terminal and final.
enum class SessionState
{
    Initializing,
    Active,
    Completed,
    Failed,
    Terminated
};

const char* to_string(SessionState state);

inline bool is_terminal(SessionState state)
{
    return state == SessionState::Completed || state == SessionState::Failed ||
           state == SessionState::Terminated;
}

/// Point-in-time view of one session
struct SessionInfo
{
    std::string session_id;
    std::string label;
    SessionState state = SessionState::Initializing;
    bool working = false; // Produced output within the working threshold
    int turn_count = 0;
    int max_turns = 0;
    size_t prompt_count = 0;
    long long runtime_ms = 0;
    uint64_t message_count = 0; // Messages received, including evicted ones
    std::vector<std::string> last_output;
    long pid = 0;
    std::optional<int> exit_code;
    std::string error;
    uint64_t decode_errors = 0;
    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> ended_at;

    json to_json() const;
};

/// Verdict of the built-in tool policy: disallowed tools are always denied;
/// a non-empty allowed list admits only its tools unless the permission mode
/// is "bypassPermissions".
PermissionResult default_tool_permission(const SpawnOptions& options,
                                         const std::string& tool_name);

/**
 * One agent process and everything received from it.
 *
 * Owns its transport and its message buffer. Frames arrive on the transport's
 * reader thread; caller operations may run concurrently from any thread.
 */
class Session
{
  public:
    Session(std::string id, std::string label, SpawnOptions options,
            const ManagerConfig& config, std::unique_ptr<Transport> transport);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * Launch the process and queue the init request and first prompt.
     * Does not wait for output. Throws SpawnFailedError; the session is then Failed.
     */
    void start(const PromptInput& prompt);

    /**
     * Send another prompt and wait until it is written.
     * Throws SessionNotActiveError for terminal sessions (nothing is written),
     * TimeoutError or TransportIoError when the write fails.
     */
    void send(const PromptInput& prompt);

    /// Read buffered messages; valid in every state
    ReadResult read(uint64_t offset, size_t limit) const;

    /// Ask the peer to stop its current turn and wait for the acknowledgement
    void interrupt();

    /// Stop the process (gracefully, then by force) and mark the session Terminated
    /// unless it already ended. Idempotent.
    void terminate();

    SessionInfo info(size_t last_output_lines = 3) const;

    SessionState state() const
    {
        return state_.load(std::memory_order_acquire);
    }

    const std::string& id() const
    {
        return id_;
    }

    const std::string& label() const
    {
        return label_;
    }

    /// When the session reached a terminal state
    std::optional<std::chrono::steady_clock::time_point> ended_at() const;

  private:
    void on_frame(protocol::DecodedFrame frame);
    void on_exit(const TransportExit& exit);

    void handle_control_request(const protocol::ControlRequest& request);
    void handle_control_response(const protocol::ControlResponse& response);
    json evaluate_permission(const json& request);
    void send_reply(const protocol::ControlResponseCommand& reply);

    // Initializing -> Active; no-op in any other state
    void activate();

    // First terminal transition wins; returns false if already terminal
    bool finish(SessionState target, const std::string& error);

    const std::string id_;
    const std::string label_;
    const SpawnOptions options_;
    const std::chrono::milliseconds control_timeout_;
    const std::chrono::milliseconds working_threshold_;
    const std::optional<ToolPermissionCallback> permission_callback_;

    std::unique_ptr<Transport> transport_;
    MessageBuffer buffer_;
    protocol::ControlProtocol control_;

    std::atomic<SessionState> state_{SessionState::Initializing};
    std::atomic<int> turn_count_{0};
    std::atomic<bool> result_seen_{false};
    std::atomic<uint64_t> decode_errors_{0};
    std::atomic<long long> last_activity_ms_; // steady_clock, since epoch

    const std::chrono::steady_clock::time_point started_;
    const std::chrono::system_clock::time_point created_at_;
    std::string init_request_id_;

    // Guards the fields below
    mutable std::mutex mutex_;
    size_t prompt_count_ = 0;
    std::optional<int> exit_code_;
    std::string error_;
    std::optional<std::chrono::steady_clock::time_point> ended_steady_;
    std::optional<std::chrono::system_clock::time_point> ended_at_;
};

} // namespace agentmux

#endif // AGENTMUX_SESSION_HPP
