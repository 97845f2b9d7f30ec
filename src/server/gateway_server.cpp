#include "mcpgate/server/gateway_server.hpp"

#include "mcpgate/exceptions.hpp"
#include "mcpgate/logging.hpp"
#include "mcpgate/util/json.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <httplib.h>
#include <sstream>

namespace mcpgate::server
{

namespace
{
const log::Logger logger("gateway");

struct ParsedUrl
{
    std::string scheme; // "http" or "https"
    std::string host;
    int port;
    std::string path; // includes leading '/'
};

ParsedUrl parse_url(const std::string& url)
{
    ParsedUrl result;
    std::string remaining = url;

    auto scheme_pos = remaining.find("://");
    if (scheme_pos != std::string::npos)
    {
        result.scheme = remaining.substr(0, scheme_pos);
        remaining = remaining.substr(scheme_pos + 3);
    }
    else
    {
        result.scheme = "http";
    }
    if (result.scheme != "http" && result.scheme != "https")
        throw ProxyError("Unsupported URL scheme: " + result.scheme);

    auto slash_pos = remaining.find('/');
    if (slash_pos != std::string::npos)
    {
        result.path = remaining.substr(slash_pos);
        remaining = remaining.substr(0, slash_pos);
    }
    else
    {
        result.path = "/";
    }

    int default_port = result.scheme == "https" ? 443 : 80;
    auto colon_pos = remaining.rfind(':');
    if (colon_pos != std::string::npos)
    {
        result.host = remaining.substr(0, colon_pos);
        try
        {
            result.port = std::stoi(remaining.substr(colon_pos + 1));
        }
        catch (const std::exception&)
        {
            result.port = default_port;
        }
    }
    else
    {
        result.host = remaining;
        result.port = default_port;
    }
    return result;
}

std::string iso8601_now()
{
    using namespace std::chrono;
    auto now = system_clock::now();
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(millis));
    return out;
}

void send_json(httplib::Response& res, int status, const Json& body)
{
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

Json error_body(const std::string& message, const std::string& code)
{
    return Json{{"error", message}, {"code", code}};
}
} // namespace

// =============================================================================
// Configuration and helpers
// =============================================================================

GatewayConfig GatewayConfig::from_json(const Json& j)
{
    if (!j.is_object())
        throw ValidationError("gateway config must be a JSON object");

    GatewayConfig config;
    config.host = j.value("host", config.host);
    config.port = j.value("port", config.port);
    config.auth_token = j.value("auth_token", config.auth_token);
    if (j.contains("settings"))
        config.settings = Settings::from_json(j["settings"]);
    if (j.contains("servers"))
    {
        if (!j["servers"].is_object())
            throw ValidationError("\"servers\" must be an object keyed by server id");
        for (const auto& [id, entry] : j["servers"].items())
        {
            try
            {
                config.servers.emplace(id, server_config_from_json(entry));
            }
            catch (const Json::exception& e)
            {
                throw ValidationError("invalid config for server " + id + ": " + e.what());
            }
        }
    }
    return config;
}

GatewayConfig GatewayConfig::load(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw NotFoundError("cannot open config file: " + path);
    std::stringstream ss;
    ss << in.rdbuf();
    try
    {
        return from_json(util::json::parse(ss.str()));
    }
    catch (const Json::parse_error& e)
    {
        throw ValidationError("config file " + path + " is not valid JSON: " + e.what());
    }
}

void validate_mcp_request(const Json& body)
{
    if (!body.is_object())
        throw ValidationError("Invalid MCP request: body must be a JSON object");
    if (!body.contains("jsonrpc") || body["jsonrpc"] != JSONRPC_VERSION)
        throw ValidationError("Invalid MCP request: jsonrpc version must be \"2.0\"");
    if (!body.contains("id") || !util::json::is_valid_id(body["id"]))
        throw ValidationError("Invalid MCP request: id must be a string or number");
    if (!body.contains("method") || !body["method"].is_string())
        throw ValidationError("Invalid MCP request: method must be a string");
}

Json make_mcp_error(const Json& id, int code, const std::string& message)
{
    return Json{{"jsonrpc", JSONRPC_VERSION},
                {"id", id},
                {"error", Json{{"code", code}, {"message", message}}}};
}

// =============================================================================
// GatewayServer
// =============================================================================

GatewayServer::GatewayServer(GatewayConfig config, std::shared_ptr<stdio::ProcessPool> pool)
    : config_(std::move(config)), pool_(std::move(pool))
{
    if (!pool_)
        pool_ = std::make_shared<stdio::ProcessPool>(
            stdio::PoolOptions::from_settings(config_.settings));
}

GatewayServer::~GatewayServer()
{
    stop();
}

bool GatewayServer::check_auth(const std::string& auth_header) const
{
    if (config_.auth_token.empty())
        return true;
    if (auth_header.find("Bearer ") != 0)
        return false;
    return auth_header.substr(7) == config_.auth_token;
}

Json GatewayServer::health() const
{
    return Json{{"status", "ok"}, {"timestamp", iso8601_now()}};
}

Json GatewayServer::list_servers() const
{
    Json servers = Json::array();
    for (const auto& [id, server] : config_.servers)
    {
        Json entry = server_config_to_json(server);
        entry["id"] = id;
        if (std::holds_alternative<StdioServerConfig>(server))
            entry["status"] = pool_->get_status(id);
        servers.push_back(std::move(entry));
    }
    return Json{{"servers", servers}};
}

McpReply GatewayServer::handle_mcp(const std::string& server_id, const std::string& path,
                                   const Json& body)
{
    validate_mcp_request(body);
    const Json& id = body["id"];

    auto it = config_.servers.find(server_id);
    if (it == config_.servers.end())
        return McpReply{200, make_mcp_error(id, MCP_INTERNAL_ERROR,
                                            "Server not found: " + server_id)};

    try
    {
        if (const auto* remote = std::get_if<RemoteServerConfig>(&it->second))
            return forward_remote(*remote, path, body);

        const auto& stdio_config = std::get<StdioServerConfig>(it->second);
        return McpReply{200, pool_->call(server_id, stdio_config, body)};
    }
    catch (const ProxyError& e)
    {
        logger.error("Failed to proxy request to " + server_id + ": " + e.what());
        return McpReply{200, make_mcp_error(id, MCP_INTERNAL_ERROR, e.what())};
    }
}

McpReply GatewayServer::forward_remote(const RemoteServerConfig& remote, const std::string& path,
                                       const Json& body)
{
    auto url = parse_url(remote.url);
    std::string target = url.path;
    if (!path.empty())
        target += (target.back() == '/' ? "" : "/") + path;

    std::string full_url = url.scheme + "://" + url.host + ":" + std::to_string(url.port);
    httplib::Client cli(full_url);
    cli.set_connection_timeout(5, 0);
    cli.set_read_timeout(config_.settings.request_timeout_ms / 1000, 0);
    cli.set_follow_location(false);

    httplib::Headers headers;
    for (const auto& [key, value] : remote.headers)
        headers.emplace(key, value);

    logger.debug("Forwarding request to " + remote.url + target);
    auto res = cli.Post(target, headers, body.dump(), "application/json");
    if (!res)
        throw ProxyError("Failed to reach MCP server at " + remote.url + ": " +
                         httplib::to_string(res.error()));

    Json reply_body;
    try
    {
        reply_body = res->body.empty() ? Json::object() : util::json::parse(res->body);
    }
    catch (const Json::parse_error&)
    {
        throw ProxyError("MCP server at " + remote.url + " returned a non-JSON body (HTTP " +
                         std::to_string(res->status) + ")");
    }
    return McpReply{res->status, std::move(reply_body)};
}

bool GatewayServer::start()
{
    if (running_)
        return false;
    svr_ = std::make_unique<httplib::Server>();

    svr_->set_payload_max_length(10 * 1024 * 1024);
    svr_->set_read_timeout(30, 0);
    svr_->set_write_timeout(30, 0);

    svr_->set_pre_routing_handler(
        [this](const httplib::Request& req, httplib::Response& res)
        {
            if (req.path == "/health")
                return httplib::Server::HandlerResponse::Unhandled;
            if (!check_auth(req.get_header_value("Authorization")))
            {
                send_json(res, 401, error_body("Unauthorized", "UNAUTHORIZED"));
                return httplib::Server::HandlerResponse::Handled;
            }
            return httplib::Server::HandlerResponse::Unhandled;
        });

    svr_->Get("/health", [this](const httplib::Request&, httplib::Response& res)
              { send_json(res, 200, health()); });

    svr_->Get("/servers", [this](const httplib::Request&, httplib::Response& res)
              { send_json(res, 200, list_servers()); });

    svr_->Get(R"(/servers/([^/]+)/status)",
              [this](const httplib::Request& req, httplib::Response& res)
              {
                  auto id = req.matches[1].str();
                  if (!config_.servers.count(id))
                  {
                      send_json(res, 404, error_body("Server not found: " + id, "NOT_FOUND"));
                      return;
                  }
                  send_json(res, 200, Json(pool_->get_status(id)));
              });

    svr_->Delete(R"(/servers/([^/]+)/process)",
                 [this](const httplib::Request& req, httplib::Response& res)
                 {
                     auto id = req.matches[1].str();
                     pool_->terminate(id);
                     send_json(res, 200, Json{{"terminated", id}});
                 });

    svr_->Post(R"(/mcp/([^/]+)/?(.*))",
               [this](const httplib::Request& req, httplib::Response& res)
               {
                   auto server_id = req.matches[1].str();
                   auto path = req.matches[2].str();
                   try
                   {
                       auto reply = handle_mcp(server_id, path, util::json::parse(req.body));
                       send_json(res, reply.status, reply.body);
                   }
                   catch (const Json::parse_error& e)
                   {
                       send_json(res, 400,
                                 error_body(std::string("Invalid JSON: ") + e.what(),
                                            "VALIDATION_ERROR"));
                   }
                   catch (const ValidationError& e)
                   {
                       send_json(res, 400, error_body(e.what(), "VALIDATION_ERROR"));
                   }
                   catch (const std::exception& e)
                   {
                       logger.error("Unhandled error for " + server_id + ": " + e.what());
                       send_json(res, 500, error_body(e.what(), "INTERNAL_ERROR"));
                   }
               });

    if (!svr_->bind_to_port(config_.host, config_.port))
    {
        logger.error("Failed to bind " + config_.host + ":" + std::to_string(config_.port));
        svr_.reset();
        return false;
    }

    running_ = true;
    thread_ = std::thread(
        [this]()
        {
            if (!svr_->listen_after_bind())
                logger.error("Listener on " + config_.host + ":" + std::to_string(config_.port) +
                             " stopped unexpectedly");
            running_ = false;
        });
    svr_->wait_until_ready();
    logger.info("Listening on " + config_.host + ":" + std::to_string(config_.port));
    return true;
}

void GatewayServer::stop()
{
    if (svr_)
        svr_->stop();
    if (thread_.joinable())
        thread_.join();
    running_ = false;
    svr_.reset();
}

} // namespace mcpgate::server
