#include "mcpgate/stdio/process_pool.hpp"

#include "mcpgate/exceptions.hpp"
#include "mcpgate/logging.hpp"
#include "mcpgate/util/json.hpp"

#include <algorithm>
#include <iterator>

namespace mcpgate::stdio
{

namespace
{
const log::Logger logger("stdio:pool");

constexpr size_t STDERR_TAIL_LINES = 20;
constexpr std::chrono::milliseconds READ_POLL_INTERVAL{100};
constexpr std::chrono::milliseconds EXIT_POLL_INTERVAL{20};
// How long a process that closed stdout gets to report an exit status
constexpr std::chrono::milliseconds EXIT_AFTER_EOF_TIMEOUT{2000};

std::string request_id_of(const Json& request)
{
    if (request.is_object() && request.contains("id"))
        return util::json::id_to_string(request["id"]);
    return "<none>";
}

std::string describe(const std::exception_ptr& error)
{
    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception& e)
    {
        return e.what();
    }
    return {};
}
} // namespace

// =============================================================================
// PoolOptions
// =============================================================================

PoolOptions PoolOptions::from_settings(const Settings& settings)
{
    PoolOptions options;
    options.request_timeout = std::chrono::milliseconds(settings.request_timeout_ms);
    options.shutdown_grace = std::chrono::milliseconds(settings.shutdown_grace_ms);
    options.crash_window = std::chrono::milliseconds(settings.crash_window_ms);
    options.spawn_confirm = std::chrono::milliseconds(settings.spawn_confirm_ms);
    options.max_crashes = settings.max_retries;
    options.retry.max_retries = settings.max_retries;
    options.retry.delay = std::chrono::milliseconds(settings.retry_delay_ms);
    return options;
}

// =============================================================================
// ManagedProcess
// =============================================================================

ManagedProcess::ManagedProcess(std::string server_id, std::shared_ptr<ProcessHandle> handle,
                               StdioServerConfig config, std::shared_ptr<util::TimerQueue> timers,
                               bool external)
    : server_id_(std::move(server_id)), label_("[" + server_id_ + "] "),
      handle_(std::move(handle)), config_(std::move(config)), external_(external),
      buffer_(std::move(timers), label_), handshake_(label_),
      last_used_(std::chrono::steady_clock::now())
{
}

ManagedProcess::~ManagedProcess()
{
    stop_readers_ = true;
    std::lock_guard<std::mutex> lock(join_mutex_);
    for (auto& t : threads_)
    {
        if (!t.joinable())
            continue;
        if (t.get_id() == std::this_thread::get_id())
            t.detach();
        else
            t.join();
    }
}

ProcessState ManagedProcess::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::chrono::steady_clock::time_point ManagedProcess::last_used() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_used_;
}

std::vector<std::string> ManagedProcess::stderr_tail() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(stderr_tail_.begin(), stderr_tail_.end());
}

void ManagedProcess::write_message(const Json& message)
{
    handle_->write(util::json::dump(message) + "\n");
}

void ManagedProcess::touch()
{
    std::lock_guard<std::mutex> lock(mutex_);
    last_used_ = std::chrono::steady_clock::now();
}

void ManagedProcess::remember_stderr(const std::string& line)
{
    std::lock_guard<std::mutex> lock(mutex_);
    stderr_tail_.push_back(line);
    while (stderr_tail_.size() > STDERR_TAIL_LINES)
        stderr_tail_.pop_front();
}

void ManagedProcess::join_threads()
{
    std::lock_guard<std::mutex> lock(join_mutex_);
    for (auto& t : threads_)
    {
        // A pool thread tearing down its own process leaves itself to the destructor
        if (t.joinable() && t.get_id() != std::this_thread::get_id())
            t.join();
    }
}

// =============================================================================
// ProcessPool
// =============================================================================

ProcessPool::ProcessPool(PoolOptions options)
    : options_(std::move(options)), timers_(std::make_shared<util::TimerQueue>())
{
    if (!options_.launcher)
        options_.launcher = std::make_shared<SubprocessLauncher>(options_.spawn_confirm);
    if (!options_.clock)
        options_.clock = []() { return PoolOptions::Clock::now(); };
}

ProcessPool::~ProcessPool()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
    }
    changed_cv_.notify_all();

    terminate_all();
    reap_retired(true);
}

std::shared_ptr<ManagedProcess> ProcessPool::get(const std::string& server_id,
                                                 const StdioServerConfig& config)
{
    if (server_id.empty())
        throw ValidationError("server id must not be empty");
    return acquire(server_id, config, true);
}

ProcessPool::ProcessPtr ProcessPool::acquire(const std::string& server_id,
                                             const StdioServerConfig& config,
                                             bool restart_on_change,
                                             const ManagedProcess* retry_origin)
{
    reap_retired(false);

    auto origin_terminating = [retry_origin]()
    {
        if (!retry_origin)
            return false;
        std::lock_guard<std::mutex> guard(retry_origin->mutex_);
        return retry_origin->terminating_;
    };

    for (;;)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (shutting_down_)
            throw ProxyError("Process pool is shutting down");
        // Checked under the pool lock so a terminate cannot slip in before the spawn below
        if (origin_terminating())
            throw RequestCancelledError("retry", "Process terminating");

        // Someone else is spawning this server: share their result
        auto spawning = spawning_.find(server_id);
        if (spawning != spawning_.end())
        {
            auto pending = spawning->second;
            lock.unlock();
            auto proc = pending.get();
            if (!restart_on_change || proc->external_ || proc->config_ == config)
                return proc;
            continue;
        }

        auto it = processes_.find(server_id);
        if (it != processes_.end())
        {
            auto proc = it->second;
            auto state = proc->state();
            if (state == ProcessState::Running && proc->alive())
            {
                if (restart_on_change && !proc->external_ && proc->config_ != config)
                {
                    lock.unlock();
                    logger.info(proc->label_ + "Config changed, restarting process");
                    terminate_process(proc);
                    continue;
                }
                proc->touch();
                return proc;
            }
            if (state == ProcessState::Running)
            {
                lock.unlock();
                retire(proc, "Process died", true);
                continue;
            }
            // Being terminated: wait for the entry to go away
            changed_cv_.wait_for(lock, EXIT_POLL_INTERVAL);
            continue;
        }

        check_crash_loop_locked(server_id);

        std::promise<ProcessPtr> promise;
        spawning_[server_id] = promise.get_future().share();
        lock.unlock();

        ProcessPtr proc;
        try
        {
            proc = spawn_process(server_id, config);
        }
        catch (const std::exception& e)
        {
            SpawnError error("Failed to spawn process for server " + server_id + ": " + e.what());
            {
                std::lock_guard<std::mutex> guard(mutex_);
                spawning_.erase(server_id);
                record_crash_locked(server_id);
            }
            changed_cv_.notify_all();
            logger.error(error.what());
            promise.set_exception(std::make_exception_ptr(error));
            throw error;
        }

        {
            std::lock_guard<std::mutex> guard(mutex_);
            spawning_.erase(server_id);
            processes_[server_id] = proc;
            start_threads(proc);
        }
        changed_cv_.notify_all();
        promise.set_value(proc);
        return proc;
    }
}

ProcessPool::ProcessPtr ProcessPool::spawn_process(const std::string& server_id,
                                                   const StdioServerConfig& config)
{
    logger.info("[" + server_id + "] Spawning process: " + config.command);
    auto handle = options_.launcher->launch(config);
    if (!handle)
        throw SpawnError("launcher returned no process");
    logger.info("[" + server_id + "] Process started (pid " + std::to_string(handle->pid()) + ")");
    return std::make_shared<ManagedProcess>(server_id, std::move(handle), config, timers_, false);
}

void ProcessPool::start_threads(const ProcessPtr& proc)
{
    auto run = [proc](const char* name, std::function<void()> body)
    {
        try
        {
            body();
        }
        catch (const std::exception& e)
        {
            logger.error(proc->label_ + name + " thread failed: " + e.what());
        }
        --proc->running_threads_;
    };

    proc->running_threads_ = 3;
    proc->threads_.emplace_back([this, proc, run]() { run("stdout", [&]() { stdout_loop(proc); }); });
    proc->threads_.emplace_back([this, proc, run]() { run("stderr", [&]() { stderr_loop(proc); }); });
    proc->threads_.emplace_back([this, proc, run]()
                                { run("dispatcher", [&]() { dispatch_loop(proc); }); });
}

std::future<Json> ProcessPool::send_request(const std::string& server_id,
                                            const StdioServerConfig& config, Json request,
                                            std::optional<std::chrono::milliseconds> timeout)
{
    if (server_id.empty())
        throw ValidationError("server id must not be empty");
    if (!request.is_object())
        throw ValidationError("request must be a JSON object");
    if (!request.contains("method") || !request["method"].is_string())
        throw ValidationError("request method must be a string");
    if (!request.contains("id") || !util::json::is_valid_id(request["id"]))
        throw ValidationError("request id must be a string or a number");
    if (!request.contains("jsonrpc"))
        request["jsonrpc"] = JSONRPC_VERSION;

    QueuedRequest item;
    item.request = std::move(request);
    item.timeout = timeout.value_or(options_.request_timeout);
    auto future = item.promise.get_future();

    // The process can die between acquire and push; its queue is closed then
    for (int attempt = 0; attempt < 2; ++attempt)
    {
        ProcessPtr proc;
        try
        {
            proc = acquire(server_id, config, true);
        }
        catch (const std::exception&)
        {
            item.promise.set_exception(std::current_exception());
            return future;
        }
        if (proc->queue_.push_back(item))
            return future;
        logger.debug(proc->label_ + "Queue closed while enqueueing, acquiring again");
    }

    item.promise.set_exception(
        std::make_exception_ptr(ProxyError("Failed to get process for server " + server_id)));
    return future;
}

// =============================================================================
// Per-process threads
// =============================================================================

void ProcessPool::stdout_loop(const ProcessPtr& proc)
{
    char chunk[4096];
    std::string reason;
    bool reader_failed = false;
    try
    {
        while (!proc->stop_readers_)
        {
            if (!proc->handle_->wait_readable(Stream::Stdout, READ_POLL_INTERVAL))
                continue;
            size_t n = proc->handle_->read(Stream::Stdout, chunk, sizeof(chunk));
            if (n == 0)
                break;
            proc->buffer_.feed(chunk, n);
        }
    }
    catch (const StreamUnavailableError& e)
    {
        reason = std::string("Process error: ") + e.what();
    }
    catch (const std::exception& e)
    {
        reason = std::string("Process error: stdout handling failed: ") + e.what();
        reader_failed = true;
    }

    if (proc->stop_readers_)
        return;

    if (reason.empty())
    {
        std::optional<int> code;
        auto deadline = std::chrono::steady_clock::now() + EXIT_AFTER_EOF_TIMEOUT;
        while (!proc->stop_readers_ && !(code = proc->handle_->exit_code()) &&
               std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(EXIT_POLL_INTERVAL);

        if (code)
            reason = "Process exited with code " + std::to_string(*code);
        else if (proc->stop_readers_)
            return;
        else
            reason = "Process closed stdout";
    }

    on_process_exit(proc, reason);

    // Nothing reads its stdout any more, so a pool-owned process must not outlive this
    if (reader_failed && !proc->external_ && !proc->handle_->exit_code())
    {
        proc->handle_->send_signal(Signal::Terminate);
        if (!wait_for_exit(*proc, options_.shutdown_grace))
            proc->handle_->send_signal(Signal::Kill);
    }
}

void ProcessPool::stderr_loop(const ProcessPtr& proc)
{
    char chunk[4096];
    std::string partial;
    auto emit = [&](const std::string& line)
    {
        if (line.empty())
            return;
        logger.warn(proc->label_ + "stderr: " + line);
        proc->remember_stderr(line);
    };

    try
    {
        while (!proc->stop_readers_)
        {
            if (!proc->handle_->wait_readable(Stream::Stderr, READ_POLL_INTERVAL))
                continue;
            size_t n = proc->handle_->read(Stream::Stderr, chunk, sizeof(chunk));
            if (n == 0)
                break;
            partial.append(chunk, n);
            size_t pos;
            while ((pos = partial.find('\n')) != std::string::npos)
            {
                std::string line = partial.substr(0, pos);
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                emit(line);
                partial.erase(0, pos + 1);
            }
        }
    }
    catch (const StreamUnavailableError& e)
    {
        logger.debug(proc->label_ + "stderr closed: " + e.what());
    }
    emit(partial);
}

void ProcessPool::dispatch_loop(const ProcessPtr& proc)
{
    while (auto item = proc->queue_.pop())
    {
        const std::string id = request_id_of(item->request);

        proc->dispatching_ = true;
        std::exception_ptr error;
        Json response;
        try
        {
            ensure_initialized(*proc);
            response = round_trip(*proc, item->request, item->timeout);
        }
        catch (const std::exception&)
        {
            error = std::current_exception();
        }
        proc->dispatching_ = false;

        if (!error)
        {
            record_success(proc->server_id_);
            proc->touch();
            item->promise.set_value(std::move(response));
            continue;
        }

        if (!options_.retry.should_retry(*item, error))
        {
            logger.debug(proc->label_ + "Request " + id + " failed: " + describe(error));
            item->promise.set_exception(error);
            continue;
        }

        item->retry_count++;
        logger.warn(proc->label_ + "Request " + id + " failed (" + describe(error) +
                    "), retrying " + std::to_string(item->retry_count) + "/" +
                    std::to_string(options_.retry.max_retries));

        if (!wait_retry_delay(*proc))
        {
            item->promise.set_exception(
                std::make_exception_ptr(RequestCancelledError(id, "Process terminating")));
            continue;
        }

        ProcessPtr target;
        try
        {
            target = acquire(proc->server_id_, proc->config_, false, proc.get());
        }
        catch (const RequestCancelledError&)
        {
            item->promise.set_exception(
                std::make_exception_ptr(RequestCancelledError(id, "Process terminating")));
            continue;
        }
        catch (const std::exception& e)
        {
            logger.warn(proc->label_ + "No process available for retry of " + id + ": " +
                        e.what());
            item->promise.set_exception(error);
            continue;
        }

        if (!target->queue_.push_front(*item))
            item->promise.set_exception(error);
        // When target is a new process this queue has been closed and pop() ends the loop
    }
}

Json ProcessPool::round_trip(ManagedProcess& proc, const Json& request,
                             std::chrono::milliseconds timeout)
{
    const Json& id = request.at("id");
    auto future = proc.buffer_.wait_for_response(id, timeout);

    // Already settled means the id was rejected as a duplicate
    if (future.wait_for(std::chrono::seconds(0)) == std::future_status::ready)
        return future.get();

    {
        std::lock_guard<std::mutex> lock(proc.mutex_);
        if (proc.terminating_)
        {
            proc.buffer_.cancel_request(id, "Process terminating");
            throw RequestCancelledError(util::json::id_to_string(id), "Process terminating");
        }
    }

    try
    {
        proc.write_message(request);
    }
    catch (const StreamUnavailableError& e)
    {
        proc.buffer_.cancel_request(id, "stdin unavailable");
        throw StreamUnavailableError("Process stdin not available for server " + proc.server_id_ +
                                     ": " + e.what());
    }

    return future.get();
}

void ProcessPool::ensure_initialized(ManagedProcess& proc)
{
    if (proc.initialized())
        return;

    proc.handshake_.run([this, &proc](const Json& request)
                        { return round_trip(proc, request, options_.request_timeout); },
                        [&proc](const Json& notification) { proc.write_message(notification); });
}

bool ProcessPool::wait_retry_delay(ManagedProcess& proc)
{
    std::unique_lock<std::mutex> lock(proc.mutex_);
    return !proc.cv_.wait_for(lock, options_.retry.delay, [&proc]() { return proc.terminating_; });
}

bool ProcessPool::wait_for_exit(ManagedProcess& proc, std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;)
    {
        if (proc.handle_->exit_code())
            return true;
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            return false;
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(EXIT_POLL_INTERVAL, deadline - now));
    }
}

// =============================================================================
// Exit, crash and termination handling
// =============================================================================

void ProcessPool::on_process_exit(const ProcessPtr& proc, const std::string& reason)
{
    bool crashed;
    {
        std::lock_guard<std::mutex> lock(proc->mutex_);
        proc->exited_ = true;
        crashed = proc->state_ == ProcessState::Running && !proc->terminating_;
    }
    proc->cv_.notify_all();

    if (crashed)
        logger.warn(proc->label_ + reason);
    else
        logger.debug(proc->label_ + reason);

    retire(proc, reason, crashed);
}

void ProcessPool::retire(const ProcessPtr& proc, const std::string& reason, bool crashed)
{
    if (proc->retired_.exchange(true))
        return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(proc->server_id_);
        if (it != processes_.end() && it->second == proc)
            processes_.erase(it);
        if (crashed)
            record_crash_locked(proc->server_id_);
        retired_.push_back(proc);
    }
    changed_cv_.notify_all();

    for (auto& item : proc->queue_.close())
        item.promise.set_exception(
            std::make_exception_ptr(ProxyError("Process cleanup: " + reason)));
    proc->buffer_.fail_all_exited(reason);

    {
        std::lock_guard<std::mutex> lock(proc->mutex_);
        if (proc->state_ == ProcessState::Running)
            proc->state_ = ProcessState::Stopped;
        proc->stderr_tail_.clear();
    }
    proc->stop_readers_ = true;
    proc->cv_.notify_all();
}

void ProcessPool::terminate(const std::string& server_id)
{
    reap_retired(false);

    ProcessPtr proc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(server_id);
        if (it == processes_.end())
            return;
        proc = it->second;
    }
    terminate_process(proc);
}

void ProcessPool::terminate_process(const ProcessPtr& proc)
{
    {
        std::unique_lock<std::mutex> lock(proc->mutex_);
        if (proc->terminating_)
        {
            // Another caller is already tearing it down
            proc->cv_.wait(lock, [&proc]() { return proc->state_ == ProcessState::Stopped; });
            return;
        }
        proc->terminating_ = true;
        if (proc->state_ == ProcessState::Running)
            proc->state_ = ProcessState::Stopping;
    }
    proc->cv_.notify_all();

    logger.info(proc->label_ + "Terminating process (pid " + std::to_string(proc->pid()) + ")");

    // Callers learn about the cancellation before any signal is sent
    proc->buffer_.cancel_all("Process terminating");
    for (auto& item : proc->queue_.close())
        item.promise.set_exception(std::make_exception_ptr(
            RequestCancelledError(request_id_of(item.request), "Process terminating")));

    if (proc->external_)
    {
        logger.info(proc->label_ + "Releasing external process without signalling it");
    }
    else if (!proc->handle_->exit_code())
    {
        proc->handle_->send_signal(Signal::Terminate);
        if (!wait_for_exit(*proc, options_.shutdown_grace))
        {
            logger.warn(proc->label_ + "Process did not exit within " +
                        std::to_string(options_.shutdown_grace.count()) + "ms, sending " +
                        to_string(Signal::Kill));
            proc->handle_->send_signal(Signal::Kill);
            if (!wait_for_exit(*proc, options_.shutdown_grace))
                logger.error(proc->label_ + "Process still running after " +
                             to_string(Signal::Kill));
        }
    }

    release(proc);
    logger.info(proc->label_ + "Process stopped");
}

void ProcessPool::release(const ProcessPtr& proc)
{
    // Suppresses crash bookkeeping from the stdout reader
    proc->retired_ = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(proc->server_id_);
        if (it != processes_.end() && it->second == proc)
            processes_.erase(it);
    }
    changed_cv_.notify_all();

    proc->stop_readers_ = true;
    proc->join_threads();
    proc->buffer_.reset();

    {
        std::lock_guard<std::mutex> lock(proc->mutex_);
        proc->state_ = ProcessState::Stopped;
        proc->stderr_tail_.clear();
    }
    proc->cv_.notify_all();
}

void ProcessPool::terminate_all()
{
    std::vector<ProcessPtr> procs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : processes_)
            procs.push_back(entry.second);
    }

    std::vector<std::future<void>> pending;
    for (const auto& proc : procs)
        pending.push_back(
            std::async(std::launch::async, [this, proc]() { terminate_process(proc); }));
    for (auto& f : pending)
        f.get();
}

void ProcessPool::reap_retired(bool wait_all)
{
    std::vector<ProcessPtr> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto first_done =
            std::partition(retired_.begin(), retired_.end(), [wait_all](const ProcessPtr& p)
                           { return !(wait_all || p->threads_finished()); });
        std::move(first_done, retired_.end(), std::back_inserter(done));
        retired_.erase(first_done, retired_.end());
    }

    for (const auto& proc : done)
    {
        if (wait_all)
        {
            {
                std::lock_guard<std::mutex> lock(proc->mutex_);
                proc->terminating_ = true;
            }
            proc->cv_.notify_all();
            proc->stop_readers_ = true;
        }
        proc->join_threads();
    }
}

// =============================================================================
// Crash bookkeeping
// =============================================================================

void ProcessPool::record_crash_locked(const std::string& server_id)
{
    auto now = options_.clock();
    auto& record = crashes_[server_id];
    if (record.count > 0 && now - record.last_crash >= options_.crash_window)
        record.count = 0;
    record.count++;
    record.last_crash = now;
    logger.warn("[" + server_id + "] Crash " + std::to_string(record.count) + " within " +
                std::to_string(options_.crash_window.count()) + "ms window");
}

void ProcessPool::check_crash_loop_locked(const std::string& server_id)
{
    auto it = crashes_.find(server_id);
    if (it == crashes_.end() || it->second.count < options_.max_crashes)
        return;

    if (options_.clock() - it->second.last_crash < options_.crash_window)
        throw CrashLoopError("Server " + server_id + " is unavailable due to repeated crashes");

    logger.info("[" + server_id + "] Crash window elapsed, allowing respawn");
    crashes_.erase(it);
}

void ProcessPool::record_success(const std::string& server_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    crashes_.erase(server_id);
}

// =============================================================================
// Queries and adoption
// =============================================================================

bool ProcessPool::has(const std::string& server_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(server_id);
    return it != processes_.end() && it->second->alive();
}

ProcessStatus ProcessPool::get_status(const std::string& server_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(server_id);
    if (it == processes_.end())
        return ProcessStatus{};

    ProcessStatus status;
    status.running = it->second->alive();
    status.pid = it->second->pid();
    status.initialized = it->second->initialized();
    return status;
}

std::vector<std::string> ProcessPool::server_ids() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(processes_.size());
    for (const auto& entry : processes_)
        ids.push_back(entry.first);
    std::sort(ids.begin(), ids.end());
    return ids;
}

void ProcessPool::register_external_process(const std::string& server_id,
                                            std::shared_ptr<ProcessHandle> handle,
                                            const StdioServerConfig& config)
{
    if (server_id.empty())
        throw ValidationError("server id must not be empty");
    if (!handle)
        throw ValidationError("external process handle must not be null");

    ProcessPtr previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(server_id);
        if (it != processes_.end())
            previous = it->second;
    }
    if (previous)
    {
        logger.info(previous->label_ + "Replacing pooled process with external one");
        terminate_process(previous);
    }

    auto proc =
        std::make_shared<ManagedProcess>(server_id, std::move(handle), config, timers_, true);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_)
            throw ProxyError("Process pool is shutting down");
        processes_[server_id] = proc;
        start_threads(proc);
    }
    changed_cv_.notify_all();
    logger.info(proc->label_ + "Registered external process (pid " + std::to_string(proc->pid()) +
                ")");
}

} // namespace mcpgate::stdio
