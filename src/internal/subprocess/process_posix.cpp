// POSIX implementation of subprocess process management
// For Linux and macOS

#include "process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <signal.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace agentmux
{
namespace subprocess
{

// ============================================================================
// ProcessHandle - POSIX implementation
// ============================================================================

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

// ============================================================================
// PipeHandle - POSIX implementation
// ============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

// ============================================================================
// Helper functions
// ============================================================================

static std::string get_errno_message(int err = errno)
{
    return std::strerror(err);
}

static void set_nonblocking(int fd)
{
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1)
        throw std::runtime_error("fcntl F_GETFL failed: " + get_errno_message());
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        throw std::runtime_error("fcntl F_SETFL failed: " + get_errno_message());
}

static int decode_wait_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

namespace
{

// Both ends of a pipe, closed on scope exit unless released
struct FdPair
{
    int fds[2] = {-1, -1};

    ~FdPair()
    {
        close_read();
        close_write();
    }

    void open(const char* what)
    {
        // Close-on-exec so concurrent spawns never leak this pipe into another child
        if (pipe2(fds, O_CLOEXEC) != 0)
            throw std::runtime_error(std::string("Failed to create ") + what +
                                     " pipe: " + get_errno_message());
    }

    int release_read()
    {
        int fd = fds[0];
        fds[0] = -1;
        return fd;
    }

    int release_write()
    {
        int fd = fds[1];
        fds[1] = -1;
        return fd;
    }

    void close_read()
    {
        if (fds[0] >= 0)
            ::close(fds[0]);
        fds[0] = -1;
    }

    void close_write()
    {
        if (fds[1] >= 0)
            ::close(fds[1]);
        fds[1] = -1;
    }
};

// What the child was doing when it gave up
enum ChildStage : int
{
    StageRedirect = 1,
    StageChdir = 2,
    StageExec = 3
};

[[noreturn]] void child_fail(int status_fd, int stage)
{
    int report[2] = {stage, errno};
    ssize_t ignored = ::write(status_fd, report, sizeof(report));
    (void)ignored;
    _exit(127);
}

std::vector<std::string> build_environment_block(const ProcessOptions& options)
{
    std::map<std::string, std::string> merged;

    if (options.inherit_environment && environ)
    {
        for (char** entry = environ; *entry; ++entry)
        {
            std::string var(*entry);
            size_t pos = var.find('=');
            if (pos == std::string::npos)
                continue;
            merged.emplace(var.substr(0, pos), var.substr(pos + 1));
        }
    }

    for (const auto& [key, value] : options.environment)
        merged[key] = value;

    std::vector<std::string> block;
    block.reserve(merged.size());
    for (const auto& [key, value] : merged)
        block.push_back(key + "=" + value);
    return block;
}

} // namespace

// ============================================================================
// ReadPipe implementation
// ============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    ssize_t bytes_read;
    do
    {
        bytes_read = ::read(handle_->fd, buffer, size);
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0; // No data available (non-blocking)
        throw std::runtime_error("Read failed: " + get_errno_message());
    }

    return static_cast<size_t>(bytes_read);
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    struct pollfd pfd;
    pfd.fd = handle_->fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int result = poll(&pfd, 1, timeout_ms);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw std::runtime_error("poll failed: " + get_errno_message());
    }

    // Hangup counts as readable so the caller observes EOF
    return result > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// WritePipe implementation
// ============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    ssize_t bytes_written;
    do
    {
        bytes_written = ::write(handle_->fd, data, size);
    } while (bytes_written < 0 && errno == EINTR);

    if (bytes_written < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0;
        if (errno == EPIPE)
            throw std::runtime_error("Broken pipe (process closed stdin)");
        throw std::runtime_error("Write failed: " + get_errno_message());
    }

    return static_cast<size_t>(bytes_written);
}

size_t WritePipe::write_all(const char* data, size_t size, std::chrono::milliseconds timeout)
{
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;

    size_t written = 0;
    while (written < size)
    {
        written += write(data + written, size - written);
        if (written == size)
            break;

        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (remaining.count() <= 0)
            break;

        struct pollfd pfd;
        pfd.fd = handle_->fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;

        int result = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (result < 0 && errno != EINTR)
            throw std::runtime_error("poll failed: " + get_errno_message());
    }

    return written;
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// Process implementation
// ============================================================================

Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    if (handle_ && handle_->running && handle_->pid > 0)
    {
        ::kill(handle_->pid, SIGKILL);
        int status;
        while (waitpid(handle_->pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        handle_->running = false;
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    if (handle_->running)
        throw std::runtime_error("Process already spawned");

    std::string path = executable;
    if (executable.find('/') == std::string::npos)
    {
        auto found = find_executable(executable);
        if (!found)
            throw std::runtime_error("Executable not found in PATH: " + executable);
        path = *found;
    }

    // Everything the child needs is built before fork
    std::vector<std::string> env_block = build_environment_block(options);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(path.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (auto& entry : env_block)
        envp.push_back(const_cast<char*>(entry.c_str()));
    envp.push_back(nullptr);

    FdPair stdin_fds, stdout_fds, stderr_fds, status_fds;
    if (options.redirect_stdin)
        stdin_fds.open("stdin");
    if (options.redirect_stdout)
        stdout_fds.open("stdout");
    if (options.redirect_stderr)
        stderr_fds.open("stderr");
    status_fds.open("status");

    pid_t pid = fork();
    if (pid < 0)
        throw std::runtime_error("Failed to fork process: " + get_errno_message());

    if (pid == 0)
    {
        // Child process: async-signal-safe calls only
        int status_fd = status_fds.fds[1];

        signal(SIGPIPE, SIG_DFL);

        if (options.redirect_stdin && dup2(stdin_fds.fds[0], STDIN_FILENO) < 0)
            child_fail(status_fd, StageRedirect);
        if (options.redirect_stdout && dup2(stdout_fds.fds[1], STDOUT_FILENO) < 0)
            child_fail(status_fd, StageRedirect);
        if (options.redirect_stderr && dup2(stderr_fds.fds[1], STDERR_FILENO) < 0)
            child_fail(status_fd, StageRedirect);

        if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0)
            child_fail(status_fd, StageChdir);

        execve(path.c_str(), argv.data(), envp.data());
        child_fail(status_fd, StageExec);
    }

    // Parent process
    stdin_fds.close_read();
    stdout_fds.close_write();
    stderr_fds.close_write();
    status_fds.close_write();

    // The status pipe closes on a successful exec; a report means the child failed
    int report[2] = {0, 0};
    ssize_t n;
    do
    {
        n = ::read(status_fds.fds[0], report, sizeof(report));
    } while (n < 0 && errno == EINTR);

    if (n > 0)
    {
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }

        std::string what = "Failed to execute " + path;
        if (report[0] == StageRedirect)
            what = "Failed to redirect stdio for " + path;
        else if (report[0] == StageChdir)
            what = "Failed to change directory to " + options.working_directory;
        throw std::runtime_error(what + ": " + get_errno_message(report[1]));
    }

    // Store process information first so a later failure still reaps the child
    handle_->pid = pid;
    handle_->running = true;
    handle_->exit_code = -1;

    if (options.redirect_stdin)
    {
        stdin_ = std::make_unique<WritePipe>();
        stdin_->handle_->fd = stdin_fds.release_write();
        set_nonblocking(stdin_->handle_->fd);
    }

    if (options.redirect_stdout)
    {
        stdout_ = std::make_unique<ReadPipe>();
        stdout_->handle_->fd = stdout_fds.release_read();
    }

    if (options.redirect_stderr)
    {
        stderr_ = std::make_unique<ReadPipe>();
        stderr_->handle_->fd = stderr_fds.release_read();
    }
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_)
        throw std::runtime_error("stdin not redirected");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_)
        throw std::runtime_error("stdout not redirected");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_)
        throw std::runtime_error("stderr not redirected");
    return *stderr_;
}

bool Process::is_running() const
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return false;

    // An exited but unreaped child still answers signal 0; check its state without reaping
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    if (waitid(P_PID, static_cast<id_t>(handle_->pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0)
        return errno != ECHILD;

    return info.si_pid == 0;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    else if (result == 0)
    {
        // Process is still running
        return std::nullopt;
    }

    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }

    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

void Process::kill()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGKILL);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

// ============================================================================
// Helper functions
// ============================================================================

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    auto is_executable = [](const fs::path& p)
    {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
    };

    if (name.empty())
        return std::nullopt;

    // Absolute or relative path: no PATH lookup
    if (name.find('/') != std::string::npos)
    {
        if (is_executable(name))
            return fs::absolute(name).lexically_normal().string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env)
        return std::nullopt;

    std::string path_str(path_env);
    size_t start = 0;
    while (start <= path_str.size())
    {
        size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();

        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path candidate = fs::path(dir) / name;
            if (is_executable(candidate))
                return candidate.string();
        }

        start = end + 1;
    }

    return std::nullopt;
}

} // namespace subprocess
} // namespace agentmux
