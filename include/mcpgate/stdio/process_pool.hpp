#pragma once
#include "mcpgate/settings.hpp"
#include "mcpgate/stdio/handshake.hpp"
#include "mcpgate/stdio/process_handle.hpp"
#include "mcpgate/stdio/request_queue.hpp"
#include "mcpgate/stdio/response_buffer.hpp"
#include "mcpgate/types.hpp"
#include "mcpgate/util/timer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace mcpgate::stdio
{

class ProcessPool;

struct PoolOptions
{
    using Clock = std::chrono::steady_clock;

    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds shutdown_grace{5000};
    std::chrono::milliseconds crash_window{60000};
    /// Crashes within crash_window after which respawning is refused
    int max_crashes{3};
    std::chrono::milliseconds spawn_confirm{100};
    RetryPolicy retry{};

    /// Defaults to a SubprocessLauncher
    std::shared_ptr<ProcessLauncher> launcher;

    /// Time source for crash-window bookkeeping. Defaults to steady_clock::now.
    std::function<Clock::time_point()> clock;

    static PoolOptions from_settings(const Settings& settings);
};

enum class ProcessState
{
    Running,
    Stopping,
    Stopped
};

/**
 * One pooled backend process and everything bound to it: its stdin writer,
 * the correlator fed by its stdout, its handshake state and its request queue.
 *
 * Owned by the pool; handed out through shared_ptr so callers can observe it.
 */
class ManagedProcess
{
  public:
    ManagedProcess(std::string server_id, std::shared_ptr<ProcessHandle> handle,
                   StdioServerConfig config, std::shared_ptr<util::TimerQueue> timers,
                   bool external);
    ~ManagedProcess();

    ManagedProcess(const ManagedProcess&) = delete;
    ManagedProcess& operator=(const ManagedProcess&) = delete;

    const std::string& server_id() const
    {
        return server_id_;
    }
    const StdioServerConfig& config() const
    {
        return config_;
    }
    int pid() const
    {
        return handle_->pid();
    }
    bool external() const
    {
        return external_;
    }
    bool alive() const
    {
        return handle_->alive();
    }
    bool initialized() const
    {
        return handshake_.initialized();
    }
    HandshakeState handshake_state() const
    {
        return handshake_.state();
    }
    bool dispatching() const
    {
        return dispatching_.load();
    }
    ProcessState state() const;
    size_t pending_count() const
    {
        return buffer_.pending_count();
    }
    size_t queued_count() const
    {
        return queue_.size();
    }
    std::chrono::steady_clock::time_point last_used() const;

    /// Last lines the process wrote to stderr (bounded)
    std::vector<std::string> stderr_tail() const;

    ProcessHandle& handle()
    {
        return *handle_;
    }

  private:
    friend class ProcessPool;

    void write_message(const Json& message);
    void touch();
    void remember_stderr(const std::string& line);
    void join_threads();
    bool threads_finished() const
    {
        return running_threads_.load() == 0;
    }

    std::string server_id_;
    std::string label_;
    std::shared_ptr<ProcessHandle> handle_;
    const StdioServerConfig config_;
    const bool external_;

    ResponseBuffer buffer_;
    Handshake handshake_;
    RequestQueue queue_;
    std::atomic<bool> dispatching_{false};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    ProcessState state_{ProcessState::Running};
    bool exited_{false};
    bool terminating_{false};
    std::chrono::steady_clock::time_point last_used_;
    std::deque<std::string> stderr_tail_;

    std::atomic<bool> retired_{false};
    std::atomic<bool> stop_readers_{false};
    std::atomic<int> running_threads_{0};
    std::mutex join_mutex_;
    std::vector<std::thread> threads_;
};

/**
 * Pool of stdio MCP backends keyed by server id.
 *
 * Spawns a backend on first use, serializes requests to it (one in flight per
 * process), performs the initialize handshake before the first request,
 * retries transient failures on a fresh process, and refuses to respawn a
 * server that keeps crashing.
 *
 * All public methods are thread-safe.
 */
class ProcessPool
{
  public:
    explicit ProcessPool(PoolOptions options = {});
    ~ProcessPool();

    ProcessPool(const ProcessPool&) = delete;
    ProcessPool& operator=(const ProcessPool&) = delete;

    /// Live process for server_id, spawning one if needed. Concurrent callers
    /// during a spawn share its result. Throws SpawnError or CrashLoopError.
    std::shared_ptr<ManagedProcess> get(const std::string& server_id,
                                        const StdioServerConfig& config);

    /// Queue a JSON-RPC request for server_id. The future yields the backend's
    /// response object or the error that ended the request.
    std::future<Json> send_request(const std::string& server_id, const StdioServerConfig& config,
                                   Json request,
                                   std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Blocking form of send_request
    Json call(const std::string& server_id, const StdioServerConfig& config, Json request,
              std::optional<std::chrono::milliseconds> timeout = std::nullopt)
    {
        return send_request(server_id, config, std::move(request), timeout).get();
    }

    /// Cancel all work for the process, then SIGTERM, then SIGKILL after the
    /// grace period. Returns once the process is gone. Unknown ids are a no-op.
    /// Processes registered as external are released but never signalled.
    void terminate(const std::string& server_id);

    void terminate_all();

    bool has(const std::string& server_id) const;

    ProcessStatus get_status(const std::string& server_id) const;

    /// Adopt a process started by someone else (e.g. a deployment supervisor).
    /// Its output is correlated and its exit handled like a pooled process.
    void register_external_process(const std::string& server_id,
                                   std::shared_ptr<ProcessHandle> handle,
                                   const StdioServerConfig& config);

    /// Server ids currently in the pool
    std::vector<std::string> server_ids() const;

    const PoolOptions& options() const
    {
        return options_;
    }

  private:
    struct CrashRecord
    {
        int count{0};
        PoolOptions::Clock::time_point last_crash{};
    };

    using ProcessPtr = std::shared_ptr<ManagedProcess>;

    /// @param restart_on_change Replace a live process whose config differs.
    ///        Retries pass false so they never tear down a newer process.
    /// @param retry_origin Process a retry comes from; once it is terminating
    ///        the retry is cancelled instead of reaching another process.
    ProcessPtr acquire(const std::string& server_id, const StdioServerConfig& config,
                       bool restart_on_change, const ManagedProcess* retry_origin = nullptr);
    ProcessPtr spawn_process(const std::string& server_id, const StdioServerConfig& config);
    void start_threads(const ProcessPtr& proc);

    void stdout_loop(const ProcessPtr& proc);
    void stderr_loop(const ProcessPtr& proc);
    void dispatch_loop(const ProcessPtr& proc);

    Json round_trip(ManagedProcess& proc, const Json& request, std::chrono::milliseconds timeout);
    void ensure_initialized(ManagedProcess& proc);
    bool wait_retry_delay(ManagedProcess& proc);
    bool wait_for_exit(ManagedProcess& proc, std::chrono::milliseconds timeout);

    void on_process_exit(const ProcessPtr& proc, const std::string& reason);
    void retire(const ProcessPtr& proc, const std::string& reason, bool crashed);
    void release(const ProcessPtr& proc);
    void terminate_process(const ProcessPtr& proc);

    // Callers hold mutex_
    void record_crash_locked(const std::string& server_id);
    void check_crash_loop_locked(const std::string& server_id);
    void record_success(const std::string& server_id);
    void reap_retired(bool wait_all);

    PoolOptions options_;
    std::shared_ptr<util::TimerQueue> timers_;

    mutable std::mutex mutex_;
    std::condition_variable changed_cv_;
    bool shutting_down_{false};
    std::unordered_map<std::string, ProcessPtr> processes_;
    std::unordered_map<std::string, std::shared_future<ProcessPtr>> spawning_;
    std::unordered_map<std::string, CrashRecord> crashes_;
    std::vector<ProcessPtr> retired_;
};

} // namespace mcpgate::stdio
