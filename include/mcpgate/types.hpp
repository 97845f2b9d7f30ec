#pragma once
#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mcpgate
{

using Json = nlohmann::json;

/// JSON-RPC protocol version tag carried by every frame.
constexpr const char* JSONRPC_VERSION = "2.0";

/// MCP protocol version sent in the initialize handshake.
constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

/// Launch parameters for a backend speaking MCP over stdin/stdout.
/// Matches the STDIO server config of the management API.
struct StdioServerConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env; ///< Overlay onto the host environment
    std::optional<std::string> cwd;
};

/// Backend reachable over HTTP; requests are forwarded as-is.
struct RemoteServerConfig
{
    std::string url;
    std::map<std::string, std::string> headers;
};

using ServerConfig = std::variant<StdioServerConfig, RemoteServerConfig>;

inline bool operator==(const StdioServerConfig& a, const StdioServerConfig& b)
{
    return a.command == b.command && a.args == b.args && a.env == b.env && a.cwd == b.cwd;
}
inline bool operator!=(const StdioServerConfig& a, const StdioServerConfig& b)
{
    return !(a == b);
}

/// Observability snapshot of a pooled process.
struct ProcessStatus
{
    bool running{false};
    std::optional<int> pid;
    std::optional<bool> initialized;
};

// nlohmann::json adapters
inline void to_json(Json& j, const StdioServerConfig& c)
{
    j = Json{{"type", "stdio"}, {"command", c.command}};
    if (!c.args.empty())
        j["args"] = c.args;
    if (!c.env.empty())
        j["env"] = c.env;
    if (c.cwd)
        j["cwd"] = *c.cwd;
}

inline void from_json(const Json& j, StdioServerConfig& c)
{
    c.command = j.at("command").get<std::string>();
    if (j.contains("args"))
        c.args = j["args"].get<std::vector<std::string>>();
    if (j.contains("env"))
        c.env = j["env"].get<std::map<std::string, std::string>>();
    if (j.contains("cwd") && !j["cwd"].is_null())
        c.cwd = j["cwd"].get<std::string>();
}

inline void to_json(Json& j, const RemoteServerConfig& c)
{
    j = Json{{"type", "remote"}, {"url", c.url}};
    if (!c.headers.empty())
        j["headers"] = c.headers;
}

inline void from_json(const Json& j, RemoteServerConfig& c)
{
    c.url = j.at("url").get<std::string>();
    if (j.contains("headers"))
        c.headers = j["headers"].get<std::map<std::string, std::string>>();
}

inline void to_json(Json& j, const ProcessStatus& s)
{
    j = Json{{"running", s.running}};
    if (s.pid)
        j["pid"] = *s.pid;
    if (s.initialized)
        j["initialized"] = *s.initialized;
}

/// Parse a server entry of the gateway config. "type" selects the variant;
/// without it, "command" means stdio and "url" means remote.
ServerConfig server_config_from_json(const Json& j);

Json server_config_to_json(const ServerConfig& config);

} // namespace mcpgate
