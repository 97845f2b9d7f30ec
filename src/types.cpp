#include "mcpgate/types.hpp"

#include "mcpgate/exceptions.hpp"

namespace mcpgate
{

ServerConfig server_config_from_json(const Json& j)
{
    if (!j.is_object())
        throw ValidationError("server config must be a JSON object");

    std::string type = j.value("type", "");
    if (type.empty())
    {
        if (j.contains("command"))
            type = "stdio";
        else if (j.contains("url"))
            type = "remote";
    }

    try
    {
        if (type == "stdio" || type == "STDIO")
            return j.get<StdioServerConfig>();
        if (type == "remote" || type == "sse" || type == "SSE")
            return j.get<RemoteServerConfig>();
    }
    catch (const Json::exception& e)
    {
        throw ValidationError(std::string("invalid server config: ") + e.what());
    }

    throw ValidationError("unsupported server type: '" + type + "'");
}

Json server_config_to_json(const ServerConfig& config)
{
    return std::visit([](const auto& c) { return Json(c); }, config);
}

} // namespace mcpgate
