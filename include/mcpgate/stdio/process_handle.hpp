#pragma once
#include "mcpgate/types.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace mcpgate::stdio
{

enum class Stream
{
    Stdout,
    Stderr
};

enum class Signal
{
    Terminate, ///< graceful stop (SIGTERM)
    Kill       ///< forced stop (SIGKILL)
};

inline const char* to_string(Signal signal)
{
    return signal == Signal::Kill ? "SIGKILL" : "SIGTERM";
}

/**
 * A running backend process as seen by the pool: a pid, a writable stdin,
 * readable stdout/stderr and liveness flags.
 *
 * Implementations must be safe to use from several threads at once: the pool
 * reads stdout and stderr on dedicated threads, writes from its dispatcher and
 * polls liveness from callers.
 */
class ProcessHandle
{
  public:
    virtual ~ProcessHandle() = default;

    virtual int pid() const = 0;

    /// True once a stop signal has been delivered
    virtual bool killed() const = 0;

    /// Non-blocking: the exit code once the process has terminated
    virtual std::optional<int> exit_code() = 0;

    bool alive()
    {
        return !killed() && !exit_code().has_value();
    }

    /// Write raw bytes to stdin. Throws StreamUnavailableError if stdin is closed.
    virtual void write(const std::string& data) = 0;

    /// Wait up to timeout for data (or EOF) on a stream
    virtual bool wait_readable(Stream stream, std::chrono::milliseconds timeout) = 0;

    /// Read available bytes. Returns 0 on EOF.
    virtual size_t read(Stream stream, char* buffer, size_t size) = 0;

    virtual void send_signal(Signal signal) = 0;
};

/// Starts backend processes. Replaced in tests to avoid real subprocesses.
class ProcessLauncher
{
  public:
    virtual ~ProcessLauncher() = default;

    /// Throws SpawnError when the process cannot be started.
    virtual std::shared_ptr<ProcessHandle> launch(const StdioServerConfig& config) = 0;
};

/// fork/exec based launcher. Stdin, stdout and stderr are all piped; the
/// environment overlay is applied on top of the gateway's own environment.
class SubprocessLauncher : public ProcessLauncher
{
  public:
    /// @param confirm_timeout How long to wait for exec to be confirmed before
    ///                        treating a process that has a pid as started
    explicit SubprocessLauncher(
        std::chrono::milliseconds confirm_timeout = std::chrono::milliseconds(100));

    std::shared_ptr<ProcessHandle> launch(const StdioServerConfig& config) override;

  private:
    std::chrono::milliseconds confirm_timeout_;
};

} // namespace mcpgate::stdio
