#include "mcpgate/exceptions.hpp"
#include "mcpgate/logging.hpp"
#include "mcpgate/server/gateway_server.hpp"
#include "mcpgate/settings.hpp"
#include "mcpgate/stdio/process_pool.hpp"
#include "mcpgate/util/json.hpp"
#include "mcpgate/version.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace
{

std::atomic<bool> g_stop{false};

static void on_signal(int)
{
    g_stop = true;
}

static int usage(int exit_code = 1)
{
    std::cout << "mcpgate " << mcpgate::VERSION_STRING << "\n";
    std::cout << "Usage:\n";
    std::cout << "  mcpgate --help\n";
    std::cout << "  mcpgate --version\n";
    std::cout << "  mcpgate serve [--config <file>] [--host <h>] [--port <p>]\n";
    std::cout << "  mcpgate call  --command <cmd> [--arg <a>]... [--env K=V]... [--cwd <dir>]\n";
    std::cout << "                --method <m> [--params <json>] [--timeout-ms <n>] [--pretty]\n";
    std::cout << "\n";
    std::cout << "Environment:\n";
    std::cout << "  MCPGATE_LOG_LEVEL, MCPGATE_REQUEST_TIMEOUT_MS, MCPGATE_SHUTDOWN_GRACE_MS,\n";
    std::cout << "  MCPGATE_RETRY_DELAY_MS, MCPGATE_MAX_RETRIES, MCPGATE_CRASH_WINDOW_MS,\n";
    std::cout << "  MCPGATE_SPAWN_CONFIRM_MS\n";
    return exit_code;
}

static bool is_flag(const std::string& s)
{
    return !s.empty() && s[0] == '-';
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

static std::vector<std::string> consume_repeated(std::vector<std::string>& args,
                                                 const std::string& flag)
{
    std::vector<std::string> values;
    while (auto v = consume_flag_value(args, flag))
        values.push_back(*v);
    return values;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static int parse_int(const std::string& s, int default_value)
{
    try
    {
        size_t pos = 0;
        int v = std::stoi(s, &pos, 10);
        if (pos != s.size())
            return default_value;
        return v;
    }
    catch (const std::exception&)
    {
        return default_value;
    }
}

static std::string first_unknown_flag(const std::vector<std::string>& rest)
{
    for (const auto& a : rest)
        if (is_flag(a))
            return a;
    return std::string();
}

static int run_serve(std::vector<std::string> args)
{
    using namespace mcpgate;

    server::GatewayConfig config;
    if (auto path = consume_flag_value(args, "--config"))
        config = server::GatewayConfig::load(*path);
    else
        config.settings = Settings::from_env();
    if (auto host = consume_flag_value(args, "--host"))
        config.host = *host;
    if (auto port = consume_flag_value(args, "--port"))
        config.port = parse_int(*port, config.port);

    if (auto bad = first_unknown_flag(args); !bad.empty())
    {
        std::cerr << "Unknown option: " << bad << "\n";
        return 2;
    }

    config.settings.apply_logging();
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    server::GatewayServer gateway(config);
    if (!gateway.start())
    {
        std::cerr << "failed to start gateway\n";
        return 1;
    }
    std::cout << "mcpgate listening on http://" << gateway.host() << ":" << gateway.port()
              << " (" << config.servers.size() << " servers)\n";

    while (!g_stop && gateway.running())
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

    gateway.stop();
    gateway.pool().terminate_all();
    return 0;
}

static int run_call(std::vector<std::string> args)
{
    using namespace mcpgate;

    bool pretty = consume_flag(args, "--pretty");
    auto command = consume_flag_value(args, "--command");
    auto method = consume_flag_value(args, "--method");
    auto params = consume_flag_value(args, "--params");
    auto cwd = consume_flag_value(args, "--cwd");
    auto timeout_ms = consume_flag_value(args, "--timeout-ms");

    StdioServerConfig config;
    config.args = consume_repeated(args, "--arg");
    for (const auto& kv : consume_repeated(args, "--env"))
    {
        auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0)
        {
            std::cerr << "--env expects KEY=VALUE, got: " << kv << "\n";
            return 2;
        }
        config.env[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    if (cwd)
        config.cwd = *cwd;

    if (auto bad = first_unknown_flag(args); !bad.empty())
    {
        std::cerr << "Unknown option: " << bad << "\n";
        return 2;
    }
    if (!command || !method)
    {
        std::cerr << "call requires --command and --method\n";
        return 2;
    }
    config.command = *command;

    auto settings = Settings::from_env();
    settings.apply_logging();

    Json request = {{"jsonrpc", JSONRPC_VERSION}, {"id", 1}, {"method", *method}};
    if (params)
        request["params"] = util::json::parse(*params);

    std::optional<std::chrono::milliseconds> timeout;
    if (timeout_ms)
        timeout = std::chrono::milliseconds(parse_int(*timeout_ms, settings.request_timeout_ms));

    stdio::ProcessPool pool(stdio::PoolOptions::from_settings(settings));
    Json response = pool.call("cli", config, request, timeout);
    std::cout << (pretty ? util::json::dump_pretty(response) : util::json::dump(response)) << "\n";
    pool.terminate_all();
    return response.contains("error") ? 3 : 0;
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
        return usage();

    std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h")
        return usage(0);
    if (cmd == "--version")
    {
        std::cout << mcpgate::VERSION_STRING << "\n";
        return 0;
    }

    std::vector<std::string> rest(argv + 2, argv + argc);
    try
    {
        if (cmd == "serve")
            return run_serve(std::move(rest));
        if (cmd == "call")
            return run_call(std::move(rest));
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return usage();
}
