#include "mcpgate/settings.hpp"

#include "mcpgate/exceptions.hpp"
#include "mcpgate/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace mcpgate
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static int getenv_int(const char* key, int defv)
{
    const char* v = std::getenv(key);
    if (!v || !*v)
        return defv;
    try
    {
        return std::stoi(v);
    }
    catch (const std::exception&)
    {
        throw ValidationError(std::string("environment variable ") + key +
                              " must be an integer, got '" + v + "'");
    }
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("MCPGATE_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    s.log_level = lvl;
    s.request_timeout_ms = getenv_int("MCPGATE_REQUEST_TIMEOUT_MS", s.request_timeout_ms);
    s.shutdown_grace_ms = getenv_int("MCPGATE_SHUTDOWN_GRACE_MS", s.shutdown_grace_ms);
    s.retry_delay_ms = getenv_int("MCPGATE_RETRY_DELAY_MS", s.retry_delay_ms);
    s.max_retries = getenv_int("MCPGATE_MAX_RETRIES", s.max_retries);
    s.crash_window_ms = getenv_int("MCPGATE_CRASH_WINDOW_MS", s.crash_window_ms);
    s.spawn_confirm_ms = getenv_int("MCPGATE_SPAWN_CONFIRM_MS", s.spawn_confirm_ms);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("request_timeout_ms"))
        s.request_timeout_ms = j.at("request_timeout_ms").get<int>();
    if (j.contains("shutdown_grace_ms"))
        s.shutdown_grace_ms = j.at("shutdown_grace_ms").get<int>();
    if (j.contains("retry_delay_ms"))
        s.retry_delay_ms = j.at("retry_delay_ms").get<int>();
    if (j.contains("max_retries"))
        s.max_retries = j.at("max_retries").get<int>();
    if (j.contains("crash_window_ms"))
        s.crash_window_ms = j.at("crash_window_ms").get<int>();
    if (j.contains("spawn_confirm_ms"))
        s.spawn_confirm_ms = j.at("spawn_confirm_ms").get<int>();
    return s;
}

void Settings::apply_logging() const
{
    log::set_level(log::level_from_string(log_level));
}

} // namespace mcpgate
