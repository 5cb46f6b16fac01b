#ifndef AGENTMUX_INTERNAL_SUBPROCESS_TRANSPORT_HPP
#define AGENTMUX_INTERNAL_SUBPROCESS_TRANSPORT_HPP

#include "../frame_codec.hpp"
#include "../subprocess/process.hpp"

#include <agentmux/config.hpp>
#include <agentmux/transport.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

namespace agentmux
{
namespace internal
{

/**
 * Subprocess transport implementation.
 *
 * Manages one agent CLI subprocess, communicating via stdin/stdout using
 * line-delimited JSON. Three threads per transport: stdout reader, stdin
 * writer, stderr drain.
 */
class SubprocessTransport : public Transport
{
  public:
    SubprocessTransport(const ManagerConfig& config, LaunchRequest request);
    ~SubprocessTransport() override;

    // Transport interface
    void start(FrameHandler on_frame, ExitHandler on_exit) override;
    std::future<void> submit(std::string frames) override;
    void end_input() override;
    void terminate(bool graceful) override;
    bool is_running() const override;
    long get_pid() const override;

  private:
    struct PendingWrite
    {
        std::string data;
        std::promise<void> done;
        bool close_after = false; // Close stdin once this entry is handled
    };

    // Background reader thread (stdout); reports the exit
    void reader_loop();

    // Background writer thread (stdin)
    void writer_loop();

    // Background stderr drain
    void stderr_loop();

    // Deliver one frame to the handler
    void dispatch(protocol::DecodedFrame frame);

    // Wait for exit up to the grace window, then SIGKILL
    std::optional<int> reap();

    void kill_process();

    // Stop accepting writes and fail everything still queued
    void shutdown_writes(const std::string& reason);

    void join_threads();

    // Configuration
    ManagerConfig config_;
    LaunchRequest request_;

    // Process management; process_mutex_ guards signalling and reaping
    std::unique_ptr<subprocess::Process> process_;
    mutable std::mutex process_mutex_;
    long pid_ = 0;

    // Message parsing (reader thread only)
    protocol::MessageParser parser_;

    FrameHandler on_frame_;
    ExitHandler on_exit_;

    // Ordered write queue
    std::mutex write_mutex_;
    std::condition_variable write_cv_; // Writer waits for work
    std::condition_variable space_cv_; // Submitters wait for room
    std::deque<PendingWrite> write_queue_;
    bool accepting_writes_ = false;
    bool writer_stop_ = false;
    std::string write_error_; // Failure that made the writer kill the process

    // Lifecycle
    std::thread reader_thread_;
    std::thread writer_thread_;
    std::thread stderr_thread_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> terminate_requested_{false};
    std::atomic<bool> exited_{false};

    std::mutex exit_mutex_;
    std::condition_variable exit_cv_;

    std::mutex terminate_mutex_; // Serializes terminate() callers
};

} // namespace internal
} // namespace agentmux

#endif // AGENTMUX_INTERNAL_SUBPROCESS_TRANSPORT_HPP
