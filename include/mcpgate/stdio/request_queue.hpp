#pragma once
#include "mcpgate/types.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <vector>

namespace mcpgate::stdio
{

/// An outbound request waiting for its turn on a backend process.
struct QueuedRequest
{
    Json request;
    std::chrono::milliseconds timeout{30000};
    int retry_count{0};
    std::promise<Json> promise;
};

/**
 * FIFO of requests for one process. Exactly one consumer (the process's
 * dispatcher) pops; producers push from any thread.
 *
 * Pushing to a closed queue fails and leaves the item with the caller, so it
 * can still be rejected.
 */
class RequestQueue
{
  public:
    /// @return false if the queue is closed; `item` is only moved from on success
    bool push_back(QueuedRequest& item);

    /// Retries go in front of work submitted after them
    bool push_front(QueuedRequest& item);

    /// Blocks until an item is available. Returns nullopt once closed.
    std::optional<QueuedRequest> pop();

    /// Close the queue and hand back everything still waiting
    std::vector<QueuedRequest> close();

    size_t size() const;
    bool closed() const;

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<QueuedRequest> items_;
    bool closed_{false};
};

struct RetryPolicy
{
    int max_retries{3};
    std::chrono::milliseconds delay{1000};

    /// Timeouts, unavailable stdin and a process that died under the request.
    /// Cancellation, duplicate ids, handshake and spawn failures are final.
    static bool is_retryable(const std::exception_ptr& error);

    bool should_retry(const QueuedRequest& item, const std::exception_ptr& error) const
    {
        return item.retry_count < max_retries && is_retryable(error);
    }
};

} // namespace mcpgate::stdio
