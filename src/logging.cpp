#include "mcpgate/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace mcpgate::log
{

namespace
{
std::atomic<Level> g_level{Level::Info};
std::mutex g_sink_mutex;
LogCallback g_sink;

void default_sink(Level level, const std::string& line)
{
    (void)level;
    std::cerr << line << std::endl;
}
} // namespace

Level level_from_string(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG" || upper == "TRACE")
        return Level::Debug;
    if (upper == "WARN" || upper == "WARNING")
        return Level::Warn;
    if (upper == "ERROR" || upper == "CRITICAL")
        return Level::Error;
    return Level::Info;
}

const char* to_string(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    }
    return "INFO";
}

void set_level(Level level)
{
    g_level = level;
}

Level level()
{
    return g_level.load();
}

void set_sink(LogCallback sink)
{
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

void reset_sink()
{
    set_sink(nullptr);
}

bool Logger::enabled(Level level) const
{
    return static_cast<int>(level) >= static_cast<int>(g_level.load());
}

void Logger::write(Level level, const std::string& message) const
{
    if (!enabled(level))
        return;

    std::string line = std::string("[mcpgate] ") + to_string(level) + " " + component_ + ": " +
                       message;

    // Serialized so lines from reader threads never interleave
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (g_sink)
        g_sink(level, line);
    else
        default_sink(level, line);
}

} // namespace mcpgate::log
