#include "subprocess_transport.hpp"

#include "launch_policy.hpp"

#include <agentmux/errors.hpp>
#include <agentmux/logging.hpp>
#include <csignal>
#include <filesystem>

namespace agentmux
{
namespace internal
{

namespace
{

// Longest stderr line logged as-is; longer lines are cut
constexpr size_t MAX_STDERR_LINE = 4096;

// Poll slice for stdout/stderr, so loops observe stop requests promptly
constexpr int READ_POLL_MS = 100;

void ignore_sigpipe()
{
    // A peer closing its stdin must surface as EPIPE, not kill the host
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

std::string millis(std::chrono::milliseconds ms)
{
    return std::to_string(ms.count()) + " ms";
}

} // namespace

SubprocessTransport::SubprocessTransport(const ManagerConfig& config, LaunchRequest request)
    : config_(config), request_(std::move(request)),
      process_(std::make_unique<subprocess::Process>()), parser_(config.max_frame_bytes)
{
}

SubprocessTransport::~SubprocessTransport()
{
    terminate(false);
}

void SubprocessTransport::start(FrameHandler on_frame, ExitHandler on_exit)
{
    if (started_)
        throw std::logic_error("Transport already started");

    ignore_sigpipe();

    std::string cli_path = resolve_executable(config_);
    auto env = build_environment(config_.environment, request_.environment);

    if (!request_.working_directory.empty())
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(request_.working_directory, ec))
            throw SpawnFailedError("Working directory does not exist: " +
                                   request_.working_directory);
    }

    // Configure process options
    subprocess::ProcessOptions proc_opts;
    proc_opts.inherit_environment = false;
    proc_opts.environment = std::move(env);
    proc_opts.working_directory = request_.working_directory;
    proc_opts.redirect_stdin = true;
    proc_opts.redirect_stdout = true;
    proc_opts.redirect_stderr = true;

    try
    {
        process_->spawn(cli_path, request_.args, proc_opts);
    }
    catch (const std::runtime_error& e)
    {
        throw SpawnFailedError(e.what());
    }

    pid_ = process_->pid();
    on_frame_ = std::move(on_frame);
    on_exit_ = std::move(on_exit);

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        accepting_writes_ = true;
    }

    started_ = true;
    writer_thread_ = std::thread(&SubprocessTransport::writer_loop, this);
    stderr_thread_ = std::thread(&SubprocessTransport::stderr_loop, this);
    reader_thread_ = std::thread(&SubprocessTransport::reader_loop, this);

    logger()->info("[{}] started {} (pid {})", request_.label, cli_path, pid_);
}

std::future<void> SubprocessTransport::submit(std::string frames)
{
    std::unique_lock<std::mutex> lock(write_mutex_);

    if (!accepting_writes_)
    {
        throw TransportIoError(write_error_.empty() ? "Transport is not accepting writes"
                                                    : write_error_);
    }

    bool has_room = space_cv_.wait_for(
        lock, config_.io_timeout, [this]
        { return write_queue_.size() < config_.max_pending_writes || !accepting_writes_; });
    if (!has_room)
        throw TimeoutError("Write queue stayed full for " + millis(config_.io_timeout));
    if (!accepting_writes_)
        throw TransportIoError("Transport closed while waiting to write");

    PendingWrite item;
    item.data = std::move(frames);
    auto future = item.done.get_future();
    write_queue_.push_back(std::move(item));
    write_cv_.notify_one();
    return future;
}

void SubprocessTransport::end_input()
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!accepting_writes_)
        return;

    accepting_writes_ = false;
    PendingWrite marker;
    marker.close_after = true;
    write_queue_.push_back(std::move(marker));
    write_cv_.notify_one();
}

void SubprocessTransport::terminate(bool graceful)
{
    if (!started_)
        return;

    std::lock_guard<std::mutex> guard(terminate_mutex_);
    terminate_requested_ = true;

    if (!exited_ && graceful)
    {
        end_input();
        std::unique_lock<std::mutex> lock(exit_mutex_);
        exit_cv_.wait_for(lock, config_.grace_period, [this] { return exited_.load(); });
    }

    if (!exited_)
        kill_process();

    // Also releases the loops when a grandchild keeps the pipes open
    stop_requested_ = true;
    join_threads();
}

bool SubprocessTransport::is_running() const
{
    return started_ && !exited_;
}

long SubprocessTransport::get_pid() const
{
    return pid_;
}

void SubprocessTransport::reader_loop()
{
    TransportExit exit;

    try
    {
        auto& out = process_->stdout_pipe();
        char buffer[4096];

        while (!stop_requested_)
        {
            // Check if stdout has data with timeout
            if (!out.has_data(READ_POLL_MS))
            {
                if (auto expired = parser_.expire_partial(config_.io_timeout))
                    dispatch(std::move(*expired));
                continue;
            }

            size_t n = out.read(buffer, sizeof(buffer));
            if (n == 0)
                break; // EOF reached

            for (auto& frame : parser_.add_data(std::string(buffer, n)))
                dispatch(std::move(frame));
        }

        // A frame cut off by EOF is still reported
        if (auto truncated = parser_.expire_partial(std::chrono::milliseconds(0)))
            dispatch(std::move(*truncated));
    }
    catch (const std::exception& e)
    {
        exit.error = std::string("Read failed: ") + e.what();
        logger()->error("[{}] {}", request_.label, exit.error);
    }

    shutdown_writes("Process output closed");
    exit.exit_code = reap();

    {
        std::lock_guard<std::mutex> lock(exit_mutex_);
        exited_ = true;
    }
    exit_cv_.notify_all();

    exit.terminated = terminate_requested_;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (exit.error.empty())
            exit.error = write_error_;
    }

    logger()->debug("[{}] process {} exited with code {}", request_.label, pid_,
                    exit.exit_code ? std::to_string(*exit.exit_code) : "unknown");

    if (!on_exit_)
        return;

    try
    {
        on_exit_(exit);
    }
    catch (const std::exception& e)
    {
        logger()->error("[{}] exit handler failed: {}", request_.label, e.what());
    }
}

void SubprocessTransport::writer_loop()
{
    while (true)
    {
        PendingWrite item;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] { return !write_queue_.empty() || writer_stop_; });
            if (write_queue_.empty())
                break;
            item = std::move(write_queue_.front());
            write_queue_.pop_front();
        }
        space_cv_.notify_one();

        auto& pipe = process_->stdin_pipe();

        if (item.close_after)
        {
            pipe.close();
            item.done.set_value();
            continue;
        }

        try
        {
            if (!pipe.is_open())
                throw std::runtime_error("stdin is closed");

            size_t written = pipe.write_all(item.data.data(), item.data.size(), config_.io_timeout);
            if (written < item.data.size())
            {
                // A partial frame is on the stream; nothing may follow it
                std::string reason = "Write timed out after " + millis(config_.io_timeout) + " (" +
                                     std::to_string(written) + " of " +
                                     std::to_string(item.data.size()) + " bytes)";
                logger()->error("[{}] {}; killing process {}", request_.label, reason, pid_);

                {
                    std::lock_guard<std::mutex> lock(write_mutex_);
                    write_error_ = reason;
                }
                item.done.set_exception(std::make_exception_ptr(TimeoutError(reason)));
                shutdown_writes(reason);
                kill_process();
                break;
            }

            item.done.set_value();
        }
        catch (const std::exception& e)
        {
            std::string reason = std::string("Write failed: ") + e.what();
            logger()->warn("[{}] {}", request_.label, reason);
            item.done.set_exception(std::make_exception_ptr(TransportIoError(reason)));
            shutdown_writes(reason);
            break;
        }
    }
}

void SubprocessTransport::stderr_loop()
{
    // Drain stderr so the child never blocks on a full pipe; lines go to the debug log
    auto emit = [this](std::string line)
    {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
            line.pop_back();
        if (!line.empty())
            logger()->debug("[{}] stderr: {}", request_.label, line);
    };

    try
    {
        auto& err = process_->stderr_pipe();
        std::string pending;
        char buffer[4096];

        while (!stop_requested_)
        {
            if (!err.has_data(READ_POLL_MS))
                continue;

            size_t n = err.read(buffer, sizeof(buffer));
            if (n == 0)
                break;

            pending.append(buffer, n);

            size_t pos;
            while ((pos = pending.find('\n')) != std::string::npos)
            {
                emit(pending.substr(0, pos));
                pending.erase(0, pos + 1);
            }

            if (pending.size() > MAX_STDERR_LINE)
            {
                emit(pending.substr(0, MAX_STDERR_LINE));
                pending.clear();
            }
        }

        if (!pending.empty())
            emit(pending);
    }
    catch (const std::exception& e)
    {
        logger()->warn("[{}] stderr drain stopped: {}", request_.label, e.what());
    }
}

void SubprocessTransport::dispatch(protocol::DecodedFrame frame)
{
    if (!on_frame_)
        return;

    try
    {
        on_frame_(std::move(frame));
    }
    catch (const std::exception& e)
    {
        logger()->error("[{}] frame handler failed: {}", request_.label, e.what());
    }
}

std::optional<int> SubprocessTransport::reap()
{
    using clock = std::chrono::steady_clock;
    const auto kill_at = clock::now() + config_.grace_period;
    const auto give_up_at = kill_at + config_.grace_period;
    bool killed = false;

    while (true)
    {
        {
            std::lock_guard<std::mutex> lock(process_mutex_);
            try
            {
                if (auto code = process_->try_wait())
                    return code;
            }
            catch (const std::exception& e)
            {
                logger()->error("[{}] could not reap process {}: {}", request_.label, pid_,
                                e.what());
                return std::nullopt;
            }

            auto now = clock::now();
            if (!killed && now >= kill_at)
            {
                logger()->warn("[{}] process {} still running after output closed; killing",
                               request_.label, pid_);
                process_->kill();
                killed = true;
            }
            else if (killed && now >= give_up_at)
            {
                // The Process destructor makes the final blocking wait
                logger()->error("[{}] process {} did not exit after SIGKILL", request_.label,
                                pid_);
                return std::nullopt;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void SubprocessTransport::kill_process()
{
    std::lock_guard<std::mutex> lock(process_mutex_);
    process_->kill();
}

void SubprocessTransport::shutdown_writes(const std::string& reason)
{
    std::deque<PendingWrite> dropped;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        accepting_writes_ = false;
        writer_stop_ = true;
        dropped.swap(write_queue_);
    }
    write_cv_.notify_all();
    space_cv_.notify_all();

    for (auto& item : dropped)
        item.done.set_exception(std::make_exception_ptr(TransportIoError(reason)));
}

void SubprocessTransport::join_threads()
{
    const auto self = std::this_thread::get_id();
    for (auto* thread : {&reader_thread_, &writer_thread_, &stderr_thread_})
    {
        if (thread->joinable() && thread->get_id() != self)
            thread->join();
    }
}

} // namespace internal

// Factory function
std::unique_ptr<Transport> create_subprocess_transport(const ManagerConfig& config,
                                                       const LaunchRequest& request)
{
    return std::make_unique<internal::SubprocessTransport>(config, request);
}

} // namespace agentmux
