#include "mcpgate/stdio/handshake.hpp"

#include "mcpgate/exceptions.hpp"
#include "mcpgate/logging.hpp"
#include "mcpgate/version.hpp"

namespace mcpgate::stdio
{

namespace
{
const log::Logger logger("stdio:handshake");
}

Handshake::Handshake(std::string label) : label_(std::move(label)) {}

Json Handshake::make_initialize_request()
{
    return Json{
        {"jsonrpc", JSONRPC_VERSION},
        {"id", INITIALIZE_REQUEST_ID},
        {"method", "initialize"},
        {"params",
         Json{{"protocolVersion", MCP_PROTOCOL_VERSION},
              {"capabilities", Json::object()},
              {"clientInfo", Json{{"name", "mcpgate"}, {"version", VERSION_STRING}}}}},
    };
}

Json Handshake::make_initialized_notification()
{
    return Json{{"jsonrpc", JSONRPC_VERSION}, {"method", "notifications/initialized"}};
}

void Handshake::run(const RequestFn& send, const NotifyFn& notify)
{
    if (initialized())
        return;

    auto expected = HandshakeState::Uninitialized;
    if (!state_.compare_exchange_strong(expected, HandshakeState::Initializing))
    {
        if (expected == HandshakeState::Initialized)
            return;
        throw HandshakeError("Process is currently initializing");
    }

    try
    {
        logger.debug(label_ + "Sending initialize request");
        Json response = send(make_initialize_request());

        if (response.contains("error") && !response["error"].is_null())
        {
            const auto& error = response["error"];
            std::string message = error.dump();
            if (error.is_object() && error.contains("message") && error["message"].is_string())
                message = error["message"].get<std::string>();
            throw HandshakeError("Initialize failed: " + message);
        }

        Json result = response.value("result", Json::object());
        if (!result.contains("protocolVersion"))
            logger.warn(label_ + "initialize result has no protocolVersion");
        else if (result["protocolVersion"] != MCP_PROTOCOL_VERSION)
            logger.info(label_ + "Backend negotiated protocol version " +
                        result["protocolVersion"].dump());

        notify(make_initialized_notification());

        {
            std::lock_guard<std::mutex> lock(mutex_);
            result_ = std::move(result);
        }
        state_ = HandshakeState::Initialized;
        logger.info(label_ + "Process initialized successfully");
    }
    catch (...)
    {
        // Leave Initializing on every path; the error belongs to the caller
        state_ = HandshakeState::Uninitialized;
        throw;
    }
}

std::optional<Json> Handshake::server_result() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return result_;
}

} // namespace mcpgate::stdio
