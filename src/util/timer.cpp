#include "mcpgate/util/timer.hpp"

#include "mcpgate/logging.hpp"

#include <exception>

namespace mcpgate::util
{

namespace
{
const log::Logger logger("timer");
}

TimerQueue::TimerQueue()
{
    thread_ = std::thread([this]() { run(); });
}

TimerQueue::~TimerQueue()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable())
        thread_.join();
}

TimerQueue::TimerId TimerQueue::schedule(std::chrono::milliseconds delay, Callback callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    TimerId id = next_id_++;
    auto deadline = Clock::now() + delay;
    timers_.emplace(std::make_pair(deadline, id), std::move(callback));
    deadlines_.emplace(id, deadline);
    cv_.notify_all();
    return id;
}

bool TimerQueue::cancel(TimerId id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = deadlines_.find(id);
    if (it == deadlines_.end())
        return false;
    timers_.erase(std::make_pair(it->second, id));
    deadlines_.erase(it);
    return true;
}

size_t TimerQueue::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void TimerQueue::run()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_)
    {
        if (timers_.empty())
        {
            cv_.wait(lock);
            continue;
        }

        auto first = timers_.begin();
        auto deadline = first->first.first;
        if (Clock::now() < deadline)
        {
            cv_.wait_until(lock, deadline);
            continue;
        }

        Callback callback = std::move(first->second);
        deadlines_.erase(first->first.second);
        timers_.erase(first);

        lock.unlock();
        try
        {
            callback();
        }
        catch (const std::exception& e)
        {
            logger.error(std::string("timer callback threw: ") + e.what());
        }
        lock.lock();
    }
}

} // namespace mcpgate::util
