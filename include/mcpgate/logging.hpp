#pragma once
#include <functional>
#include <string>

namespace mcpgate::log
{

enum class Level
{
    Debug,
    Info,
    Warn,
    Error
};

using LogCallback = std::function<void(Level, const std::string&)>;

/// Parse "DEBUG", "info", "WARNING", ... (case-insensitive). Unknown names map to Info.
Level level_from_string(const std::string& name);
const char* to_string(Level level);

/// Minimum level that reaches the sink. Defaults to Info.
void set_level(Level level);
Level level();

/// Replace the output sink. The default prints to stderr.
void set_sink(LogCallback sink);
void reset_sink();

/// Component-scoped logger. Lines look like "[mcpgate] WARN stdio:pool: message".
class Logger
{
  public:
    explicit Logger(std::string component) : component_(std::move(component)) {}

    void debug(const std::string& message) const
    {
        write(Level::Debug, message);
    }
    void info(const std::string& message) const
    {
        write(Level::Info, message);
    }
    void warn(const std::string& message) const
    {
        write(Level::Warn, message);
    }
    void error(const std::string& message) const
    {
        write(Level::Error, message);
    }

    bool enabled(Level level) const;

  private:
    void write(Level level, const std::string& message) const;

    std::string component_;
};

} // namespace mcpgate::log
