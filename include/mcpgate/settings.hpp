#pragma once
#include "mcpgate/types.hpp"

#include <string>

namespace mcpgate
{

struct Settings
{
    std::string log_level{"INFO"};
    int request_timeout_ms{30000};
    int shutdown_grace_ms{5000};
    int retry_delay_ms{1000};
    int max_retries{3};
    int crash_window_ms{60000};
    int spawn_confirm_ms{100};

    static Settings from_env();
    static Settings from_json(const Json& j);

    /// Apply log_level to the global logger.
    void apply_logging() const;
};

} // namespace mcpgate
