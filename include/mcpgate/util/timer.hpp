#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace mcpgate::util
{

/**
 * Cancellable one-shot timers serviced by a single background thread.
 *
 * Callbacks run on the timer thread without any internal lock held, so a
 * callback may schedule or cancel other timers. cancel() only guarantees the
 * callback will not be *started* afterwards; owners that need stronger
 * guarantees must re-check their own state inside the callback.
 */
class TimerQueue
{
  public:
    using Callback = std::function<void()>;
    using TimerId = std::uint64_t;
    using Clock = std::chrono::steady_clock;

    TimerQueue();
    ~TimerQueue();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    TimerId schedule(std::chrono::milliseconds delay, Callback callback);

    /// @return true if the timer was still pending and has been removed
    bool cancel(TimerId id);

    /// Number of timers not yet started
    size_t pending() const;

  private:
    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::pair<Clock::time_point, TimerId>, Callback> timers_;
    std::unordered_map<TimerId, Clock::time_point> deadlines_;
    TimerId next_id_{1};
    bool stopping_{false};
    std::thread thread_;
};

} // namespace mcpgate::util
