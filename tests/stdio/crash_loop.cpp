#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <string>

#include "fake_process.hpp"
#include "mcpgate/exceptions.hpp"
#include "mcpgate/logging.hpp"
#include "mcpgate/stdio/process_pool.hpp"

using mcpgate::Json;
using mcpgate::StdioServerConfig;
using mcpgate::stdio::PoolOptions;
using mcpgate::stdio::ProcessPool;
using mcpgate::testing::FakeLauncher;
using mcpgate::testing::FakeProcess;
using mcpgate::testing::wait_until;
using namespace std::chrono_literals;

// Steady clock that tests can move forward by hand
struct ManualClock {
  PoolOptions::Clock::time_point base{PoolOptions::Clock::now()};
  std::atomic<long long> offset_ms{0};

  void advance(std::chrono::milliseconds by) { offset_ms += by.count(); }

  std::function<PoolOptions::Clock::time_point()> fn() {
    return [this]() { return base + std::chrono::milliseconds(offset_ms.load()); };
  }
};

static StdioServerConfig fake_config() {
  StdioServerConfig cfg;
  cfg.command = "flaky-server";
  return cfg;
}

static Json request(int id, const std::string& method) {
  return Json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
}

static PoolOptions fake_options(std::shared_ptr<FakeLauncher> launcher, ManualClock& clock) {
  PoolOptions options;
  options.launcher = std::move(launcher);
  options.clock = clock.fn();
  options.retry.delay = 10ms;
  options.shutdown_grace = 500ms;
  options.request_timeout = 2000ms;
  return options;
}

// Crashes whenever it is asked to "boom", behaves otherwise
static std::shared_ptr<FakeLauncher> crashing_launcher() {
  return std::make_shared<FakeLauncher>([](int pid, const StdioServerConfig&) {
    return std::make_shared<FakeProcess>(pid, [](FakeProcess& self, const Json& msg) {
      if (msg.value("method", "") == "boom") {
        self.emit_stderr("fatal: boom\n");
        self.exit(1);
        return;
      }
      FakeProcess::echo_responder()(self, msg);
    });
  });
}

template <typename E>
static bool throws(const std::function<void()>& fn, std::string* message = nullptr) {
  try {
    fn();
  } catch (const E& e) {
    if (message) *message = e.what();
    return true;
  } catch (const std::exception&) {
    return false;
  }
  return false;
}

void test_spawn_failures_trip_the_breaker() {
  std::cout << "test_spawn_failures_trip_the_breaker...\n";
  ManualClock clock;
  auto launcher = std::make_shared<FakeLauncher>();
  ProcessPool pool(fake_options(launcher, clock));
  launcher->set_fail_spawns(true);

  for (int i = 0; i < 3; ++i) {
    std::string msg;
    assert(throws<mcpgate::SpawnError>([&]() { pool.get("flaky", fake_config()); }, &msg));
    assert(msg.find("Failed to spawn process for server flaky") != std::string::npos);
    assert(msg.find("ENOENT") != std::string::npos);
    clock.advance(1s);
  }
  assert(launcher->spawn_count() == 3);

  // Fourth attempt is refused without touching the launcher
  std::string msg;
  assert(throws<mcpgate::CrashLoopError>([&]() { pool.get("flaky", fake_config()); }, &msg));
  assert(msg == "Server flaky is unavailable due to repeated crashes");
  assert(launcher->spawn_count() == 3);

  // Queued requests learn about it through their future
  auto f = pool.send_request("flaky", fake_config(), request(1, "ping"));
  assert(throws<mcpgate::CrashLoopError>([&]() { f.get(); }));

  // Other servers are unaffected
  launcher->set_fail_spawns(false);
  assert(pool.get("steady", fake_config())->pid() == 1004);
  assert(throws<mcpgate::CrashLoopError>([&]() { pool.get("flaky", fake_config()); }));
  std::cout << "  [PASS]\n";
}

void test_breaker_resets_after_window() {
  std::cout << "test_breaker_resets_after_window...\n";
  ManualClock clock;
  auto launcher = std::make_shared<FakeLauncher>();
  ProcessPool pool(fake_options(launcher, clock));
  launcher->set_fail_spawns(true);

  for (int i = 0; i < 3; ++i)
    assert(throws<mcpgate::SpawnError>([&]() { pool.get("flaky", fake_config()); }));

  clock.advance(59s);
  assert(throws<mcpgate::CrashLoopError>([&]() { pool.get("flaky", fake_config()); }));

  clock.advance(2s);  // 61s since the last crash
  launcher->set_fail_spawns(false);
  auto proc = pool.get("flaky", fake_config());
  assert(proc->pid() == 1004);
  assert(launcher->spawn_count() == 4);
  std::cout << "  [PASS]\n";
}

void test_crashes_outside_window_do_not_accumulate() {
  std::cout << "test_crashes_outside_window_do_not_accumulate...\n";
  ManualClock clock;
  auto launcher = std::make_shared<FakeLauncher>();
  ProcessPool pool(fake_options(launcher, clock));
  launcher->set_fail_spawns(true);

  for (int i = 0; i < 6; ++i) {
    assert(throws<mcpgate::SpawnError>([&]() { pool.get("slowfail", fake_config()); }));
    clock.advance(61s);
  }
  assert(launcher->spawn_count() == 6);
  std::cout << "  [PASS]\n";
}

void test_crash_mid_request_retries_on_new_process() {
  std::cout << "test_crash_mid_request_retries_on_new_process...\n";
  ManualClock clock;
  // First process dies on its first real request, later ones are healthy
  auto launcher = std::make_shared<FakeLauncher>([](int pid, const StdioServerConfig&) {
    return std::make_shared<FakeProcess>(pid, [pid](FakeProcess& self, const Json& msg) {
      if (pid == 1001 && msg.value("method", "") == "tools/call") {
        self.exit(1);
        return;
      }
      FakeProcess::echo_responder()(self, msg);
    });
  });
  ProcessPool pool(fake_options(launcher, clock));

  auto r = pool.call("flaky", fake_config(), request(7, "tools/call"));
  assert(r["id"] == 7);
  assert(r["result"]["pid"] == 1002);
  assert(launcher->spawn_count() == 2);

  // The replacement performed its own handshake
  auto methods = launcher->at(1)->methods();
  assert(methods.size() == 3);
  assert(methods[0] == "initialize");
  assert(methods[2] == "tools/call");
  assert(pool.get_status("flaky").pid.value_or(0) == 1002);
  std::cout << "  [PASS]\n";
}

void test_retries_stop_at_crash_loop() {
  std::cout << "test_retries_stop_at_crash_loop...\n";
  ManualClock clock;
  auto launcher = crashing_launcher();
  ProcessPool pool(fake_options(launcher, clock));

  std::string msg;
  assert(throws<mcpgate::ProcessExitedError>(
      [&]() { pool.call("flaky", fake_config(), request(1, "boom")); }, &msg));
  assert(msg.find("Process exited with code 1") != std::string::npos);
  assert(launcher->spawn_count() == 3);
  assert(throws<mcpgate::CrashLoopError>([&]() { pool.get("flaky", fake_config()); }));

  clock.advance(61s);
  auto r = pool.call("flaky", fake_config(), request(2, "ping"));
  assert(r["result"]["pid"] == 1004);
  std::cout << "  [PASS]\n";
}

void test_success_clears_crash_history() {
  std::cout << "test_success_clears_crash_history...\n";
  ManualClock clock;
  auto launcher = crashing_launcher();
  auto options = fake_options(launcher, clock);
  options.retry.max_retries = 1;
  ProcessPool pool(options);

  // Two crashes: the original attempt and its single retry
  assert(throws<mcpgate::ProcessExitedError>(
      [&]() { pool.call("flaky", fake_config(), request(1, "boom")); }));
  assert(launcher->spawn_count() == 2);

  pool.call("flaky", fake_config(), request(2, "ping"));
  assert(launcher->spawn_count() == 3);

  // Two more would make four within the window had the success not cleared them
  assert(throws<mcpgate::ProcessExitedError>(
      [&]() { pool.call("flaky", fake_config(), request(3, "boom")); }));
  assert(launcher->spawn_count() == 4);

  auto proc = pool.get("flaky", fake_config());
  assert(proc->pid() == 1005);
  std::cout << "  [PASS]\n";
}

void test_queued_requests_rejected_on_crash() {
  std::cout << "test_queued_requests_rejected_on_crash...\n";
  ManualClock clock;
  auto launcher = std::make_shared<FakeLauncher>([](int pid, const StdioServerConfig&) {
    return std::make_shared<FakeProcess>(pid, [](FakeProcess& self, const Json& msg) {
      if (msg.value("method", "") == "hang") return;
      FakeProcess::echo_responder()(self, msg);
    });
  });
  auto options = fake_options(launcher, clock);
  options.retry.max_retries = 0;
  ProcessPool pool(options);

  auto in_flight = pool.send_request("flaky", fake_config(), request(1, "hang"));
  auto queued_a = pool.send_request("flaky", fake_config(), request(2, "ping"));
  auto queued_b = pool.send_request("flaky", fake_config(), request(3, "ping"));
  assert(wait_until([&]() { return launcher->spawn_count() == 1 && launcher->last() &&
                                   !launcher->last()->written().empty() &&
                                   launcher->last()->written().back().value("method", "") ==
                                       "hang"; }));
  launcher->last()->exit(2);

  std::string msg;
  assert(throws<mcpgate::ProcessExitedError>([&]() { in_flight.get(); }, &msg));
  assert(msg.find("code 2") != std::string::npos);
  for (auto* f : {&queued_a, &queued_b}) {
    std::string queued_msg;
    assert(throws<mcpgate::ProxyError>([&]() { f->get(); }, &queued_msg));
    assert(queued_msg.find("Process cleanup") != std::string::npos);
  }
  assert(wait_until([&]() { return !pool.has("flaky"); }));
  std::cout << "  [PASS]\n";
}

int main() {
  mcpgate::log::set_level(mcpgate::log::Level::Error);
  test_spawn_failures_trip_the_breaker();
  test_breaker_resets_after_window();
  test_crashes_outside_window_do_not_accumulate();
  test_crash_mid_request_retries_on_new_process();
  test_retries_stop_at_crash_loop();
  test_success_clears_crash_history();
  test_queued_requests_rejected_on_crash();
  std::cout << "All crash loop tests passed\n";
  return 0;
}
