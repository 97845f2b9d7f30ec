#include "mcpgate/stdio/response_buffer.hpp"

#include "mcpgate/exceptions.hpp"
#include "mcpgate/logging.hpp"
#include "mcpgate/util/json.hpp"

#include <vector>

namespace mcpgate::stdio
{

namespace
{
const log::Logger logger("stdio:buffer");

std::string trim(const std::string& s)
{
    const char* ws = " \t\r\f\v";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos)
        return std::string();
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

// "1" and 1 are different ids; keying by the serialized form keeps them apart
std::string key_for(const Json& id)
{
    return id.dump();
}
} // namespace

ResponseBuffer::ResponseBuffer(std::shared_ptr<util::TimerQueue> timers, std::string label)
    : timers_(timers ? std::move(timers) : std::make_shared<util::TimerQueue>()),
      state_(std::make_shared<State>()), label_(std::move(label))
{
}

ResponseBuffer::~ResponseBuffer()
{
    fail_all("Buffer destroyed", FailKind::Cancelled);
}

void ResponseBuffer::feed(const char* data, size_t size)
{
    std::vector<std::string> lines;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->buffer.append(data, size);

        size_t start = 0;
        size_t pos;
        while ((pos = state_->buffer.find('\n', start)) != std::string::npos)
        {
            lines.push_back(state_->buffer.substr(start, pos - start));
            start = pos + 1;
        }
        // Keep the trailing (possibly incomplete) fragment
        state_->buffer.erase(0, start);
    }

    for (const auto& line : lines)
        process_line(line);
}

void ResponseBuffer::process_line(const std::string& line)
{
    auto trimmed = trim(line);
    if (trimmed.empty())
        return;

    Json message;
    try
    {
        message = util::json::parse(trimmed);
    }
    catch (const Json::parse_error& e)
    {
        logger.warn(label_ + "Failed to parse JSON line: " + trimmed.substr(0, 100) + " (" +
                    e.what() + ")");
        return;
    }

    if (!message.is_object() || !message.contains("jsonrpc") || !message["jsonrpc"].is_string() ||
        message["jsonrpc"].get<std::string>() != JSONRPC_VERSION)
    {
        logger.warn(label_ + "Received non-JSON-RPC 2.0 message: " + trimmed.substr(0, 100));
        return;
    }

    if (!message.contains("id"))
    {
        const bool named = message.contains("method") && message["method"].is_string();
        logger.debug(label_ + "Received notification (no id): " +
                     (named ? message["method"].get<std::string>() : std::string("<no method>")));
        return;
    }

    route_response(std::move(message));
}

void ResponseBuffer::route_response(Json response)
{
    const Json& id = response["id"];
    auto key = key_for(id);

    Pending pending;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->pending.find(key);
        if (it == state_->pending.end())
        {
            logger.warn(label_ + "Received response for unknown request id " +
                        util::json::id_to_string(id));
            return;
        }
        pending = std::move(it->second);
        state_->pending.erase(it);
    }

    timers_->cancel(pending.timer);
    pending.promise.set_value(std::move(response));
}

std::future<Json> ResponseBuffer::wait_for_response(const Json& id,
                                                    std::chrono::milliseconds timeout)
{
    auto display = util::json::id_to_string(id);
    auto key = key_for(id);

    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->pending.count(key))
    {
        std::promise<Json> rejected;
        rejected.set_exception(std::make_exception_ptr(DuplicateRequestIdError(display)));
        return rejected.get_future();
    }

    Pending pending;
    pending.display_id = display;
    pending.token = state_->next_token++;
    auto future = pending.promise.get_future();

    std::weak_ptr<State> weak = state_;
    auto token = pending.token;
    auto label = label_;
    // Scheduling under the lock is fine: the timer thread never takes state_->mutex
    // while holding its own lock.
    pending.timer = timers_->schedule(
        timeout, [weak, key, token, timeout, label]()
        { on_timeout(weak, key, token, timeout, label); });

    state_->pending.emplace(key, std::move(pending));
    return future;
}

void ResponseBuffer::on_timeout(const std::weak_ptr<State>& weak, const std::string& key,
                                std::uint64_t token, std::chrono::milliseconds timeout,
                                const std::string& label)
{
    auto state = weak.lock();
    if (!state)
        return;

    Pending pending;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        auto it = state->pending.find(key);
        // Settled (or re-registered) after this timer was dequeued
        if (it == state->pending.end() || it->second.token != token)
            return;
        pending = std::move(it->second);
        state->pending.erase(it);
    }

    logger.warn(label + "Request " + pending.display_id + " timed out after " +
                std::to_string(timeout.count()) + "ms");
    pending.promise.set_exception(
        std::make_exception_ptr(RequestTimeoutError(pending.display_id, timeout)));
}

void ResponseBuffer::cancel_request(const Json& id, const std::string& reason)
{
    Pending pending;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->pending.find(key_for(id));
        if (it == state_->pending.end())
            return;
        pending = std::move(it->second);
        state_->pending.erase(it);
    }

    timers_->cancel(pending.timer);
    pending.promise.set_exception(
        std::make_exception_ptr(RequestCancelledError(pending.display_id, reason)));
}

void ResponseBuffer::cancel_all(const std::string& reason)
{
    fail_all(reason, FailKind::Cancelled);
}

void ResponseBuffer::fail_all_exited(const std::string& reason)
{
    fail_all(reason, FailKind::Exited);
}

void ResponseBuffer::fail_all(const std::string& reason, FailKind kind)
{
    std::unordered_map<std::string, Pending> drained;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        drained.swap(state_->pending);
    }

    for (auto& [key, pending] : drained)
    {
        (void)key;
        timers_->cancel(pending.timer);
        if (kind == FailKind::Exited)
            pending.promise.set_exception(
                std::make_exception_ptr(ProcessExitedError(pending.display_id, reason)));
        else
            pending.promise.set_exception(
                std::make_exception_ptr(RequestCancelledError(pending.display_id, reason)));
    }
}

void ResponseBuffer::reset()
{
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->buffer.clear();
        state_->buffer.shrink_to_fit();
    }
    cancel_all("Buffer reset");
}

size_t ResponseBuffer::pending_count() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->pending.size();
}

} // namespace mcpgate::stdio
