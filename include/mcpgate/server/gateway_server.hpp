#pragma once
#include "mcpgate/settings.hpp"
#include "mcpgate/stdio/process_pool.hpp"
#include "mcpgate/types.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <thread>

namespace httplib
{
class Server;
}

namespace mcpgate::server
{

/// JSON-RPC "internal error", used for every upstream failure
constexpr int MCP_INTERNAL_ERROR = -32603;

struct GatewayConfig
{
    std::string host{"127.0.0.1"};
    int port{18080};
    std::string auth_token; ///< empty = no auth required
    Settings settings;
    std::map<std::string, ServerConfig> servers;

    /// {"host", "port", "auth_token", "settings": {...}, "servers": {"<id>": {...}}}
    static GatewayConfig from_json(const Json& j);
    static GatewayConfig load(const std::string& path);
};

/// Throws ValidationError unless body is a JSON-RPC 2.0 request
void validate_mcp_request(const Json& body);

Json make_mcp_error(const Json& id, int code, const std::string& message);

/// Status and body returned to the HTTP client
struct McpReply
{
    int status{200};
    Json body;
};

/**
 * HTTP front end of the gateway.
 *
 * POST /mcp/<serverId>[/<path>]  proxy a JSON-RPC request
 * GET  /health                   liveness
 * GET  /servers                  configured servers and their process status
 * GET  /servers/<id>/status      pool status of one server
 * DELETE /servers/<id>/process   terminate the server's pooled process
 */
class GatewayServer
{
  public:
    /// @param pool Shared pool; one built from config.settings is created when null
    explicit GatewayServer(GatewayConfig config, std::shared_ptr<stdio::ProcessPool> pool = nullptr);
    ~GatewayServer();

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    bool start();
    void stop();
    bool running() const
    {
        return running_.load();
    }
    int port() const
    {
        return config_.port;
    }
    const std::string& host() const
    {
        return config_.host;
    }

    /// Route one request. Throws ValidationError for a malformed body; every
    /// other failure becomes an MCP error object.
    McpReply handle_mcp(const std::string& server_id, const std::string& path, const Json& body);

    Json health() const;
    Json list_servers() const;

    stdio::ProcessPool& pool()
    {
        return *pool_;
    }

  private:
    bool check_auth(const std::string& auth_header) const;
    McpReply forward_remote(const RemoteServerConfig& remote, const std::string& path,
                            const Json& body);

    GatewayConfig config_;
    std::shared_ptr<stdio::ProcessPool> pool_;
    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace mcpgate::server
