// POSIX implementation of subprocess management for the stdio pool

#include "process.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern "C" char** environ;

namespace mcpgate::process
{

// =============================================================================
// Platform-specific handle structures
// =============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    bool signaled = false;
    int exit_code = -1;
};

// =============================================================================
// Helper functions
// =============================================================================

static std::string get_errno_message(int err = errno)
{
    return std::strerror(err);
}

static void close_pair(int fds[2])
{
    for (int i = 0; i < 2; ++i)
    {
        if (fds[i] >= 0)
        {
            ::close(fds[i]);
            fds[i] = -1;
        }
    }
}

static int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// Report errno to the parent through the exec status pipe and exit
[[noreturn]] static void child_fail(int error_fd)
{
    int err = errno;
    (void)::write(error_fd, &err, sizeof(err));
    _exit(127);
}

// =============================================================================
// ReadPipe implementation
// =============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    ssize_t bytes_read;
    do
    {
        bytes_read = ::read(handle_->fd, buffer, size);
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0;
        throw ProcessError("Read failed: " + get_errno_message());
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

    int result = ::poll(&pfd, 1, timeout_ms);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw ProcessError("poll failed: " + get_errno_message());
    }

    // POLLHUP without POLLIN means EOF; read() will return 0
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

// =============================================================================
// WritePipe implementation
// =============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw BrokenPipeError("Pipe is not open");

    size_t total_written = 0;
    while (total_written < size)
    {
        ssize_t bytes_written = ::write(handle_->fd, data + total_written, size - total_written);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw BrokenPipeError("Broken pipe (process closed stdin)");
            throw ProcessError("Write failed: " + get_errno_message());
        }
        total_written += static_cast<size_t>(bytes_written);
    }

    return total_written;
}

size_t WritePipe::write(const std::string& data)
{
    return write(data.data(), data.size());
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

// =============================================================================
// Process implementation
// =============================================================================

Process::Process()
    : handle_(std::make_unique<ProcessHandle>()), stdin_(std::make_unique<WritePipe>()),
      stdout_(std::make_unique<ReadPipe>()), stderr_(std::make_unique<ReadPipe>())
{
}

Process::~Process()
{
    stdin_->close();
    stdout_->close();
    stderr_->close();

    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_->pid > 0 && handle_->running)
    {
        // Never leave a zombie or an orphan behind
        ::kill(handle_->pid, SIGKILL);
        int status;
        while (waitpid(handle_->pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        handle_->running = false;
    }
}

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    // Parent-side ends must not leak into other children, or a sibling would
    // keep this child's stdin open after we close it.
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};

    auto close_all = [&]()
    {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(error_pipe);
    };

    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0 || pipe2(error_pipe, O_CLOEXEC) != 0)
    {
        int err = errno;
        close_all();
        throw ProcessError("Failed to create pipes: " + get_errno_message(err));
    }

    // Build argv/envp before fork; only async-signal-safe calls in the child
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    std::map<std::string, std::string> merged;
    for (char** env = environ; env && *env; ++env)
    {
        std::string entry(*env);
        auto eq = entry.find('=');
        if (eq != std::string::npos)
            merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [key, value] : options.environment)
        merged[key] = value;

    std::vector<std::string> env_strings;
    env_strings.reserve(merged.size());
    for (const auto& [key, value] : merged)
        env_strings.push_back(key + "=" + value);
    std::vector<char*> envp;
    for (auto& entry : env_strings)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
    {
        int err = errno;
        close_all();
        throw ProcessError("Failed to fork process: " + get_errno_message(err));
    }

    if (pid == 0)
    {
        // Child process. dup2 clears FD_CLOEXEC on the new descriptors.
        if (dup2(stdin_pipe[0], STDIN_FILENO) < 0 || dup2(stdout_pipe[1], STDOUT_FILENO) < 0 ||
            dup2(stderr_pipe[1], STDERR_FILENO) < 0)
            child_fail(error_pipe[1]);

        // The gateway ignores SIGPIPE; backends expect the default
        ::signal(SIGPIPE, SIG_DFL);

        if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0)
            child_fail(error_pipe[1]);

        execvpe(executable.c_str(), argv.data(), envp.data());
        child_fail(error_pipe[1]);
    }

    // Parent process
    ::close(stdin_pipe[0]);
    stdin_pipe[0] = -1;
    ::close(stdout_pipe[1]);
    stdout_pipe[1] = -1;
    ::close(stderr_pipe[1]);
    stderr_pipe[1] = -1;
    ::close(error_pipe[1]);
    error_pipe[1] = -1;

    // Two terminal signals race here: the child reporting an exec error, and
    // the pipe closing because exec succeeded (O_CLOEXEC). Whichever comes
    // first wins. If neither arrives within the window the child has a pid
    // and is treated as started.
    int child_errno = 0;
    ssize_t error_bytes = 0;
    struct pollfd pfd;
    pfd.fd = error_pipe[0];
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ready;
    do
    {
        ready = ::poll(&pfd, 1, options.confirm_timeout_ms);
    } while (ready < 0 && errno == EINTR);
    if (ready > 0)
    {
        do
        {
            error_bytes = ::read(error_pipe[0], &child_errno, sizeof(child_errno));
        } while (error_bytes < 0 && errno == EINTR);
    }
    close_pair(error_pipe);

    if (error_bytes > 0)
    {
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        close_all();
        throw ProcessError("Failed to execute '" + executable +
                           "': " + get_errno_message(child_errno));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    stdin_->handle_->fd = stdin_pipe[1];
    stdout_->handle_->fd = stdout_pipe[0];
    stderr_->handle_->fd = stderr_pipe[0];
    handle_->pid = pid;
    handle_->running = true;
    handle_->signaled = false;
    handle_->exit_code = -1;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_->is_open())
        throw BrokenPipeError("stdin pipe not available");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_->is_open())
        throw ProcessError("stdout pipe not available");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_->is_open())
        throw ProcessError("stderr pipe not available");
    return *stderr_;
}

std::optional<int> Process::try_wait()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_->pid == 0)
        return handle_->exit_code;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result = waitpid(handle_->pid, &status, WNOHANG);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    if (result == 0)
        return std::nullopt;
    if (errno == EINTR)
        return std::nullopt;

    throw ProcessError("waitpid failed: " + get_errno_message());
}

void Process::send(int sig)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_->pid > 0 && handle_->running)
    {
        if (::kill(handle_->pid, sig) == 0)
            handle_->signaled = true;
    }
}

void Process::terminate()
{
    send(SIGTERM);
}

void Process::kill()
{
    send(SIGKILL);
}

bool Process::signaled() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_->signaled;
}

int Process::pid() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(handle_->pid);
}

} // namespace mcpgate::process
