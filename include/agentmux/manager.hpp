#ifndef AGENTMUX_MANAGER_HPP
#define AGENTMUX_MANAGER_HPP

#include <agentmux/config.hpp>
#include <agentmux/message_buffer.hpp>
#include <agentmux/session.hpp>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace agentmux
{

/// Result of SessionManager::list_sessions
struct ListSessionsResult
{
    std::vector<SessionInfo> active;    // Initializing or Active
    std::vector<SessionInfo> completed; // Terminal; filled only when requested
    size_t total_active = 0;
    size_t total_completed = 0;

    /// {"active_sessions", "completed_sessions", "total_active", "total_completed"}
    json to_json() const;
};

/**
 * Registry of concurrent agent sessions.
 *
 * All operations are thread-safe. The registry lock covers only map access;
 * process I/O always happens outside it.
 *
 * Example:
 * @code
 * agentmux::SessionManager manager(config);
 * auto ids = manager.spawn("Summarize README.md", options);
 * auto page = manager.get_session_output(ids[0], 0, 50);
 * @endcode
 */
class SessionManager
{
  public:
    explicit SessionManager(ManagerConfig config = {});
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * Start options.worker_count identical sessions.
     * @return Session ids, in worker order
     * @throws SpawnFailedError on invalid options or launch failure
     * @throws CapacityExceededError if the sessions would exceed max_sessions
     */
    std::vector<std::string> spawn(const PromptInput& prompt, const SpawnOptions& options = {});

    /// Send another prompt to a running session
    void send_prompt(const std::string& session_id, const PromptInput& prompt);

    /// Page through a session's buffered messages
    ReadResult get_session_output(const std::string& session_id, uint64_t offset,
                                  size_t limit) const;

    SessionInfo get_session_info(const std::string& session_id,
                                 size_t last_output_lines = 3) const;

    /// Sessions sorted working-first, then longest-running first
    ListSessionsResult list_sessions(bool include_completed = true,
                                     size_t last_output_lines = 3) const;

    /// Cancel the session's in-flight turn
    void interrupt_session(const std::string& session_id);

    /// Stop a session. Succeeds again on an already-terminal session.
    void terminate_session(const std::string& session_id);

    /// Evict a terminal session now instead of after the retention window
    void remove_session(const std::string& session_id);

    /// Evict terminal sessions older than the retention window
    /// @return Number of sessions evicted
    size_t cleanup_expired();

    /// Terminate every session and stop background cleanup
    void shutdown();

    const ManagerConfig& config() const
    {
        return config_;
    }

  private:
    std::shared_ptr<Session> find(const std::string& session_id) const;

    // Non-terminal sessions plus outstanding reservations; caller holds mutex_
    size_t count_active_locked() const;

    void cleanup_loop();

    ManagerConfig config_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
    size_t reserved_ = 0; // Slots held by spawns in progress
    bool shutting_down_ = false;

    std::condition_variable cleanup_cv_;
    std::thread cleanup_thread_;
};

} // namespace agentmux

#endif // AGENTMUX_MANAGER_HPP
