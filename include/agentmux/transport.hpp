#ifndef AGENTMUX_TRANSPORT_HPP
#define AGENTMUX_TRANSPORT_HPP

#include <agentmux/types.hpp>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentmux
{

// Forward declarations
struct ManagerConfig;

/// How a transport's process ended. Reported exactly once per started transport.
struct TransportExit
{
    std::optional<int> exit_code; // Empty if the process could not be reaped
    std::string error;            // Read/write failure that ended the transport, if any
    bool terminated = false;      // terminate() was requested
};

/// What to launch for one session
struct LaunchRequest
{
    std::string session_id;
    std::string label;
    std::vector<std::string> args;                  // Command line after the executable
    std::map<std::string, std::string> environment; // Caller overrides, filtered at launch
    std::string working_directory;
};

/**
 * Abstract transport interface for one agent process.
 *
 * A transport owns its peer end to end: it launches it, decodes inbound frames
 * on a dedicated reader, writes outbound frames in submission order, and tears
 * the peer down. Frames and the exit report are delivered on the transport's
 * own threads, so handlers must not call terminate().
 *
 * Implementations include:
 * - SubprocessTransport: Local subprocess using stdin/stdout
 */
class Transport
{
  public:
    using FrameHandler = std::function<void(protocol::DecodedFrame frame)>;
    using ExitHandler = std::function<void(const TransportExit& exit)>;

    virtual ~Transport() = default;

    /**
     * Launch the peer and begin delivering frames.
     * Throws SpawnFailedError if the peer cannot be started.
     */
    virtual void start(FrameHandler on_frame, ExitHandler on_exit) = 0;

    /**
     * Queue one or more newline-terminated frames.
     * The future completes when the bytes are written, or carries
     * TimeoutError / TransportIoError.
     * Throws TimeoutError if the queue stays full for the I/O timeout.
     */
    virtual std::future<void> submit(std::string frames) = 0;

    /**
     * Queue frames and wait until they are written.
     */
    virtual void write(const std::string& frames)
    {
        submit(frames).get();
    }

    /**
     * End the input stream once queued frames are flushed.
     * Signals the peer that no more input will be sent.
     */
    virtual void end_input() = 0;

    /**
     * Stop the peer. Graceful closes input and waits for the grace window
     * before killing; otherwise kills at once. Idempotent.
     */
    virtual void terminate(bool graceful) = 0;

    /**
     * Check if the peer process is still alive.
     */
    virtual bool is_running() const = 0;

    /**
     * Get the process ID for subprocess transports.
     * Returns 0 for non-subprocess transports.
     */
    virtual long get_pid() const
    {
        return 0;
    }
};

using TransportFactory = std::function<std::unique_ptr<Transport>(const LaunchRequest& request)>;

// Factory for the default subprocess transport
std::unique_ptr<Transport> create_subprocess_transport(const ManagerConfig& config,
                                                       const LaunchRequest& request);

} // namespace agentmux

#endif // AGENTMUX_TRANSPORT_HPP
