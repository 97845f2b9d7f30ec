// Minimal MCP backend speaking newline-delimited JSON-RPC on stdin/stdout.
// Used by the end-to-end tests and handy for trying `mcpgate call`.
//
//   initialize   -> protocolVersion, capabilities, serverInfo
//   tools/list   -> "echo" and "add"
//   tools/call   -> runs one of them
//   ping         -> {}
//   anything else with an id is echoed back as {method, params, echoed: true}
//
// Notifications are ignored. Diagnostics (including each initialize and
// notification received) go to stderr.

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

using Json = nlohmann::json;

namespace
{

Json tools_list()
{
    Json echo_schema = {{"type", "object"},
                        {"properties", {{"message", {{"type", "string"}}}}},
                        {"required", Json::array({"message"})}};
    Json add_schema = {{"type", "object"},
                       {"properties", {{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}}},
                       {"required", Json::array({"a", "b"})}};
    return Json{{"tools", Json::array({
                              {{"name", "echo"},
                               {"description", "Echo the message back"},
                               {"inputSchema", echo_schema}},
                              {{"name", "add"},
                               {"description", "Add two numbers"},
                               {"inputSchema", add_schema}},
                          })}};
}

Json text_content(const std::string& text)
{
    return Json{{"content", Json::array({{{"type", "text"}, {"text", text}}})}};
}

Json call_tool(const Json& params, std::string& error)
{
    auto name = params.value("name", "");
    auto args = params.value("arguments", Json::object());
    if (name == "echo")
        return text_content(args.value("message", ""));
    if (name == "add")
    {
        double sum = args.at("a").get<double>() + args.at("b").get<double>();
        return text_content(Json(sum).dump());
    }
    error = "Unknown tool: " + name;
    return nullptr;
}

Json handle(const Json& request)
{
    const auto method = request.value("method", "");
    const auto params = request.value("params", Json::object());

    Json response = {{"jsonrpc", "2.0"}, {"id", request["id"]}};
    if (method == "initialize")
    {
        std::cerr << "echo-stdio-server: initialize\n";
        response["result"] = {
            {"protocolVersion", params.value("protocolVersion", "2024-11-05")},
            {"capabilities", {{"tools", Json::object()}}},
            {"serverInfo", {{"name", "echo-stdio-server"}, {"version", "1.0.0"}}}};
    }
    else if (method == "tools/list")
    {
        response["result"] = tools_list();
    }
    else if (method == "tools/call")
    {
        std::string error;
        Json result = call_tool(params, error);
        if (!error.empty())
            response["error"] = {{"code", -32602}, {"message", error}};
        else
            response["result"] = result;
    }
    else if (method == "ping")
    {
        response["result"] = Json::object();
    }
    else
    {
        response["result"] = {{"method", method}, {"params", params}, {"echoed", true}};
    }
    return response;
}

} // namespace

int main()
{
    std::ios::sync_with_stdio(false);
    std::string line;
    while (std::getline(std::cin, line))
    {
        if (line.find_first_not_of(" \t\r") == std::string::npos)
            continue;

        Json request;
        try
        {
            request = Json::parse(line);
        }
        catch (const Json::parse_error& e)
        {
            std::cerr << "echo-stdio-server: ignoring malformed line: " << e.what() << "\n";
            continue;
        }

        if (!request.is_object())
        {
            std::cerr << "echo-stdio-server: ignoring non-object frame\n";
            continue;
        }
        if (!request.contains("id"))
        {
            const bool named = request.contains("method") && request["method"].is_string();
            std::cerr << "echo-stdio-server: notification "
                      << (named ? request["method"].get<std::string>() : std::string("?")) << "\n";
            continue;
        }

        Json response;
        try
        {
            response = handle(request);
        }
        catch (const Json::exception& e)
        {
            response = {{"jsonrpc", "2.0"},
                        {"id", request["id"]},
                        {"error", {{"code", -32602}, {"message", e.what()}}}};
        }
        std::cout << response.dump() << "\n" << std::flush;
    }
    return 0;
}
