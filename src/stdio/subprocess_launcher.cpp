#include "internal/process.hpp"
#include "mcpgate/exceptions.hpp"
#include "mcpgate/stdio/process_handle.hpp"

#include <csignal>
#include <mutex>

namespace mcpgate::stdio
{

namespace
{

/// ProcessHandle over a fork/exec'd child with all three streams piped
class SpawnedProcess final : public ProcessHandle
{
  public:
    explicit SpawnedProcess(std::unique_ptr<process::Process> process)
        : process_(std::move(process)), pid_(process_->pid())
    {
    }

    int pid() const override
    {
        return pid_;
    }

    bool killed() const override
    {
        return process_->signaled();
    }

    std::optional<int> exit_code() override
    {
        try
        {
            return process_->try_wait();
        }
        catch (const process::ProcessError&)
        {
            // Reaped elsewhere (ECHILD): the process is gone either way
            return -1;
        }
    }

    void write(const std::string& data) override
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        try
        {
            process_->stdin_pipe().write(data);
        }
        catch (const process::ProcessError& e)
        {
            throw StreamUnavailableError(e.what());
        }
    }

    bool wait_readable(Stream stream, std::chrono::milliseconds timeout) override
    {
        try
        {
            return pipe(stream).has_data(static_cast<int>(timeout.count()));
        }
        catch (const process::ProcessError& e)
        {
            throw StreamUnavailableError(e.what());
        }
    }

    size_t read(Stream stream, char* buffer, size_t size) override
    {
        try
        {
            return pipe(stream).read(buffer, size);
        }
        catch (const process::ProcessError& e)
        {
            throw StreamUnavailableError(e.what());
        }
    }

    void send_signal(Signal signal) override
    {
        if (signal == Signal::Kill)
            process_->kill();
        else
            process_->terminate();
    }

  private:
    process::ReadPipe& pipe(Stream stream)
    {
        return stream == Stream::Stderr ? process_->stderr_pipe() : process_->stdout_pipe();
    }

    std::unique_ptr<process::Process> process_;
    int pid_;
    std::mutex write_mutex_;
};

void ignore_sigpipe()
{
    static std::once_flag once;
    std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

} // namespace

SubprocessLauncher::SubprocessLauncher(std::chrono::milliseconds confirm_timeout)
    : confirm_timeout_(confirm_timeout)
{
    // A write to a dead child must surface as EPIPE, not kill the gateway
    ignore_sigpipe();
}

std::shared_ptr<ProcessHandle> SubprocessLauncher::launch(const StdioServerConfig& config)
{
    if (config.command.empty())
        throw SpawnError("command is empty");

    process::ProcessOptions options;
    options.environment = config.env;
    if (config.cwd)
        options.working_directory = *config.cwd;
    options.confirm_timeout_ms = static_cast<int>(confirm_timeout_.count());

    auto proc = std::make_unique<process::Process>();
    try
    {
        proc->spawn(config.command, config.args, options);
    }
    catch (const process::ProcessError& e)
    {
        throw SpawnError(e.what());
    }
    return std::make_shared<SpawnedProcess>(std::move(proc));
}

} // namespace mcpgate::stdio
