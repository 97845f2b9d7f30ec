#include <cassert>
#include <cstdlib>
#include <string>
#include "mcpgate/exceptions.hpp"
#include "mcpgate/logging.hpp"
#include "mcpgate/settings.hpp"

static void set_env(const char* name, const char* value) {
  setenv(name, value, 1);
}

int main() {
  using namespace mcpgate;
  // Defaults
  Settings d;
  assert(d.log_level == "INFO");
  assert(d.request_timeout_ms == 30000);
  assert(d.shutdown_grace_ms == 5000);
  assert(d.retry_delay_ms == 1000);
  assert(d.max_retries == 3);
  assert(d.crash_window_ms == 60000);

  // JSON parse; missing keys keep their defaults
  auto s = Settings::from_json(Json{{"log_level","debug"},{"request_timeout_ms",1500},{"max_retries",5}});
  assert(s.log_level == "debug");
  assert(s.request_timeout_ms == 1500);
  assert(s.max_retries == 5);
  assert(s.shutdown_grace_ms == 5000);

  // Env parse (set locally)
  set_env("MCPGATE_LOG_LEVEL","warn");
  set_env("MCPGATE_REQUEST_TIMEOUT_MS","2500");
  set_env("MCPGATE_CRASH_WINDOW_MS","10000");
  auto e = Settings::from_env();
  assert(e.log_level == "WARN"); // uppercased
  assert(e.request_timeout_ms == 2500);
  assert(e.crash_window_ms == 10000);
  assert(e.retry_delay_ms == 1000);

  e.apply_logging();
  assert(log::level() == log::Level::Warn);

  // Bytes outside ASCII pass through untouched
  set_env("MCPGATE_LOG_LEVEL","w\xc3\xa4rn");
  assert(Settings::from_env().log_level == "W\xc3\xa4RN");
  set_env("MCPGATE_LOG_LEVEL","warn");

  // Malformed numbers are reported, not silently defaulted
  set_env("MCPGATE_MAX_RETRIES","lots");
  bool threw = false;
  try {
    Settings::from_env();
  } catch (const ValidationError& err) {
    threw = std::string(err.what()).find("MCPGATE_MAX_RETRIES") != std::string::npos;
  }
  assert(threw);
  return 0;
}
