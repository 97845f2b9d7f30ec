#include "mcpgate/stdio/request_queue.hpp"

#include "mcpgate/exceptions.hpp"

namespace mcpgate::stdio
{

bool RequestQueue::push_back(QueuedRequest& item)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return false;
        items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
}

bool RequestQueue::push_front(QueuedRequest& item)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return false;
        items_.push_front(std::move(item));
    }
    cv_.notify_one();
    return true;
}

std::optional<QueuedRequest> RequestQueue::pop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return closed_ || !items_.empty(); });
    if (closed_)
        return std::nullopt;
    QueuedRequest item = std::move(items_.front());
    items_.pop_front();
    return item;
}

std::vector<QueuedRequest> RequestQueue::close()
{
    std::vector<QueuedRequest> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        remaining.reserve(items_.size());
        for (auto& item : items_)
            remaining.push_back(std::move(item));
        items_.clear();
    }
    cv_.notify_all();
    return remaining;
}

size_t RequestQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

bool RequestQueue::closed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool RetryPolicy::is_retryable(const std::exception_ptr& error)
{
    if (!error)
        return false;
    try
    {
        std::rethrow_exception(error);
    }
    catch (const RequestTimeoutError&)
    {
        return true;
    }
    catch (const StreamUnavailableError&)
    {
        return true;
    }
    catch (const ProcessExitedError&)
    {
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

} // namespace mcpgate::stdio
