#pragma once
#include "mcpgate/types.hpp"
#include "mcpgate/util/timer.hpp"

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mcpgate::stdio
{

constexpr std::chrono::milliseconds DEFAULT_REQUEST_TIMEOUT{30000};

/**
 * Reassembles newline-delimited JSON-RPC frames from a backend's stdout and
 * routes each response to the request waiting on its id.
 *
 * Chunks may split frames at any byte. Malformed lines, frames that are not
 * JSON-RPC 2.0, notifications and responses nobody is waiting for are logged
 * and dropped; feed() never throws because of what the backend wrote.
 *
 * Thread-safe: feed() is called from the stdout reader while requests are
 * registered and cancelled from other threads.
 */
class ResponseBuffer
{
  public:
    /// @param timers Shared timer thread; a private one is created when null
    /// @param label  Prefix for log lines (usually the server id)
    explicit ResponseBuffer(std::shared_ptr<util::TimerQueue> timers = nullptr,
                            std::string label = "");
    ~ResponseBuffer();

    ResponseBuffer(const ResponseBuffer&) = delete;
    ResponseBuffer& operator=(const ResponseBuffer&) = delete;

    void feed(const char* data, size_t size);
    void feed(const std::string& chunk)
    {
        feed(chunk.data(), chunk.size());
    }

    /// Register interest in the response carrying `id`.
    /// A second registration for an id that is still pending yields a future
    /// that is already failed with DuplicateRequestIdError; the first is untouched.
    std::future<Json> wait_for_response(const Json& id,
                                        std::chrono::milliseconds timeout = DEFAULT_REQUEST_TIMEOUT);

    /// Fail one pending request with RequestCancelledError. Unknown ids are ignored.
    void cancel_request(const Json& id, const std::string& reason);

    void cancel_all(const std::string& reason);

    /// Like cancel_all, but with ProcessExitedError so callers know the backend died.
    void fail_all_exited(const std::string& reason);

    /// Drop any partial frame and cancel everything with "Buffer reset".
    void reset();

    size_t pending_count() const;

  private:
    struct Pending
    {
        std::string display_id;
        std::promise<Json> promise;
        util::TimerQueue::TimerId timer{0};
        std::uint64_t token{0};
    };

    struct State
    {
        mutable std::mutex mutex;
        std::string buffer;
        std::unordered_map<std::string, Pending> pending;
        std::uint64_t next_token{1};
    };

    enum class FailKind
    {
        Cancelled,
        Exited
    };

    void process_line(const std::string& line);
    void route_response(Json response);
    void fail_all(const std::string& reason, FailKind kind);
    static void on_timeout(const std::weak_ptr<State>& weak, const std::string& key,
                           std::uint64_t token, std::chrono::milliseconds timeout,
                           const std::string& label);

    std::shared_ptr<util::TimerQueue> timers_;
    std::shared_ptr<State> state_;
    std::string label_;
};

} // namespace mcpgate::stdio
