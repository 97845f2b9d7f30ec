#pragma once
#include "mcpgate/types.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace mcpgate::stdio
{

enum class HandshakeState
{
    Uninitialized,
    Initializing,
    Initialized
};

/// Id used for the initialize request sent to every backend.
constexpr const char* INITIALIZE_REQUEST_ID = "init-1";

/**
 * One-time MCP negotiation for a backend process:
 * `initialize` request, then the `notifications/initialized` notification.
 *
 * A failed handshake leaves the state Uninitialized so the next run() retries.
 */
class Handshake
{
  public:
    /// Sends a request and blocks until its correlated response (or throws)
    using RequestFn = std::function<Json(const Json&)>;
    /// Writes a fire-and-forget message
    using NotifyFn = std::function<void(const Json&)>;

    explicit Handshake(std::string label = "");

    /// No-op when already initialized. Throws HandshakeError while another
    /// run() is in progress or when the backend answers with an error;
    /// errors from `send`/`notify` propagate unchanged.
    void run(const RequestFn& send, const NotifyFn& notify);

    HandshakeState state() const
    {
        return state_.load();
    }
    bool initialized() const
    {
        return state_.load() == HandshakeState::Initialized;
    }

    /// The backend's initialize result (protocolVersion, capabilities, serverInfo)
    std::optional<Json> server_result() const;

    static Json make_initialize_request();
    static Json make_initialized_notification();

  private:
    std::string label_;
    std::atomic<HandshakeState> state_{HandshakeState::Uninitialized};
    mutable std::mutex mutex_;
    std::optional<Json> result_;
};

} // namespace mcpgate::stdio
