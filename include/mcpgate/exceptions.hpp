#pragma once
#include <chrono>
#include <stdexcept>
#include <string>

namespace mcpgate
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

/// Failure talking to an upstream MCP server. Surfaced as 502 at the HTTP boundary.
struct ProxyError : public Error
{
    using Error::Error;

    const char* code() const noexcept
    {
        return "PROXY_ERROR";
    }
    int status_code() const noexcept
    {
        return 502;
    }
};

/// The OS could not start the backend process.
struct SpawnError : public ProxyError
{
    using ProxyError::ProxyError;
};

/// The backend's stdin is missing or closed.
struct StreamUnavailableError : public ProxyError
{
    using ProxyError::ProxyError;
};

struct RequestTimeoutError : public ProxyError
{
    RequestTimeoutError(std::string request_id, std::chrono::milliseconds timeout)
        : ProxyError("Request " + request_id + " timed out after " +
                     std::to_string(timeout.count()) + "ms"),
          request_id(std::move(request_id)), timeout(timeout)
    {
    }

    std::string request_id;
    std::chrono::milliseconds timeout;
};

struct RequestCancelledError : public ProxyError
{
    RequestCancelledError(const std::string& request_id, std::string reason)
        : ProxyError("Request " + request_id + " cancelled: " + reason), reason(std::move(reason))
    {
    }

    std::string reason;
};

/// Pending request abandoned because its process exited or errored.
struct ProcessExitedError : public RequestCancelledError
{
    using RequestCancelledError::RequestCancelledError;
};

struct DuplicateRequestIdError : public ProxyError
{
    explicit DuplicateRequestIdError(const std::string& request_id)
        : ProxyError("Duplicate request id: " + request_id)
    {
    }
};

struct HandshakeError : public ProxyError
{
    using ProxyError::ProxyError;
};

/// Respawn refused because the server crashed too often within the crash window.
struct CrashLoopError : public ProxyError
{
    using ProxyError::ProxyError;
};

} // namespace mcpgate
