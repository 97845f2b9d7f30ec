#include <cassert>
#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "fake_process.hpp"
#include "mcpgate/exceptions.hpp"
#include "mcpgate/logging.hpp"
#include "mcpgate/stdio/process_pool.hpp"

using mcpgate::Json;
using mcpgate::StdioServerConfig;
using mcpgate::stdio::PoolOptions;
using mcpgate::stdio::ProcessPool;
using mcpgate::stdio::ProcessState;
using mcpgate::stdio::Signal;
using mcpgate::testing::FakeLauncher;
using mcpgate::testing::FakeProcess;
using mcpgate::testing::wait_until;
using namespace std::chrono_literals;

static StdioServerConfig fake_config() {
  StdioServerConfig cfg;
  cfg.command = "fake-server";
  return cfg;
}

static Json request(int id, const std::string& method) {
  return Json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
}

// Never answers "hang"
static std::shared_ptr<FakeLauncher> hanging_launcher() {
  return std::make_shared<FakeLauncher>([](int pid, const StdioServerConfig&) {
    return std::make_shared<FakeProcess>(pid, [](FakeProcess& self, const Json& msg) {
      if (msg.value("method", "") == "hang") return;
      FakeProcess::echo_responder()(self, msg);
    });
  });
}

static long count_of_hang(const std::shared_ptr<FakeLauncher>& launcher) {
  auto p = launcher->last();
  if (!p) return 0;
  long n = 0;
  for (const auto& m : p->methods())
    if (m == "hang") ++n;
  return n;
}

static bool cancelled_for_termination(std::future<Json>& f) {
  try {
    f.get();
  } catch (const mcpgate::RequestCancelledError& e) {
    return std::string(e.what()).find("Process terminating") != std::string::npos;
  } catch (const std::exception&) {
    return false;
  }
  return false;
}

void test_graceful_stop_sends_only_sigterm() {
  std::cout << "test_graceful_stop_sends_only_sigterm...\n";
  auto launcher = std::make_shared<FakeLauncher>();
  PoolOptions options;
  options.launcher = launcher;
  ProcessPool pool(options);  // default 5s grace

  auto proc = pool.get("t", fake_config());
  auto start = std::chrono::steady_clock::now();
  pool.terminate("t");
  assert(std::chrono::steady_clock::now() - start < 2s);

  auto signals = launcher->last()->signals();
  assert(signals.size() == 1);
  assert(signals[0] == Signal::Terminate);
  assert(launcher->last()->exit_code().value_or(0) == 143);
  assert(!pool.has("t"));
  assert(!pool.get_status("t").running);
  assert(proc->state() == ProcessState::Stopped);
  std::cout << "  [PASS]\n";
}

void test_stubborn_process_gets_sigkill_after_grace() {
  std::cout << "test_stubborn_process_gets_sigkill_after_grace...\n";
  auto launcher = std::make_shared<FakeLauncher>([](int pid, const StdioServerConfig&) {
    auto p = std::make_shared<FakeProcess>(pid);
    p->set_ignore_terminate(true);
    return p;
  });
  PoolOptions options;
  options.launcher = launcher;
  options.shutdown_grace = 200ms;
  ProcessPool pool(options);

  pool.get("stubborn", fake_config());
  auto start = std::chrono::steady_clock::now();
  pool.terminate("stubborn");
  auto elapsed = std::chrono::steady_clock::now() - start;
  assert(elapsed >= 200ms);
  assert(elapsed < 2s);

  auto signals = launcher->last()->signals();
  assert(signals.size() == 2);
  assert(signals[0] == Signal::Terminate);
  assert(signals[1] == Signal::Kill);
  assert(launcher->last()->exit_code().value_or(0) == 137);
  assert(!pool.has("stubborn"));
  std::cout << "  [PASS]\n";
}

void test_pending_and_queued_requests_cancelled() {
  std::cout << "test_pending_and_queued_requests_cancelled...\n";
  auto launcher = hanging_launcher();
  PoolOptions options;
  options.launcher = launcher;
  options.retry.delay = 10ms;
  ProcessPool pool(options);

  auto in_flight = pool.send_request("t", fake_config(), request(1, "hang"));
  auto queued_a = pool.send_request("t", fake_config(), request(2, "ping"));
  auto queued_b = pool.send_request("t", fake_config(), request(3, "ping"));
  assert(wait_until([&]() {
    auto p = launcher->last();
    return p && !p->written().empty() && p->written().back().value("method", "") == "hang";
  }));
  auto proc = pool.get("t", fake_config());
  assert(proc->pending_count() == 1);
  assert(proc->queued_count() == 2);

  pool.terminate("t");
  assert(cancelled_for_termination(in_flight));
  assert(cancelled_for_termination(queued_a));
  assert(cancelled_for_termination(queued_b));

  // Cancellation is not retried: nothing respawned behind our back
  assert(launcher->spawn_count() == 1);
  assert(!pool.has("t"));
  assert(proc->pending_count() == 0);
  std::cout << "  [PASS]\n";
}

void test_terminate_interrupts_retry_wait() {
  std::cout << "test_terminate_interrupts_retry_wait...\n";
  auto launcher = hanging_launcher();
  PoolOptions options;
  options.launcher = launcher;
  options.retry.delay = 5000ms;
  ProcessPool pool(options);

  auto f = pool.send_request("t", fake_config(), request(1, "hang"), 30ms);
  auto proc = pool.get("t", fake_config());
  // Timed out once and now sleeping before the retry
  assert(wait_until([&]() {
    return count_of_hang(launcher) == 1 && proc->pending_count() == 0 && !proc->dispatching();
  }));
  std::this_thread::sleep_for(20ms);

  auto start = std::chrono::steady_clock::now();
  pool.terminate("t");
  assert(cancelled_for_termination(f));
  assert(std::chrono::steady_clock::now() - start < 2s);
  assert(launcher->spawn_count() == 1);
  std::cout << "  [PASS]\n";
}

void test_terminate_during_rapid_retries_leaves_nothing_behind() {
  std::cout << "test_terminate_during_rapid_retries_leaves_nothing_behind...\n";
  for (int round = 0; round < 20; ++round) {
    auto launcher = hanging_launcher();
    PoolOptions options;
    options.launcher = launcher;
    options.retry.delay = 0ms;
    options.retry.max_retries = 100000;
    options.shutdown_grace = 200ms;
    ProcessPool pool(options);

    auto f = pool.send_request("r", fake_config(), request(1, "hang"), 2ms);
    assert(wait_until([&]() { return count_of_hang(launcher) >= 2; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(round % 7));

    pool.terminate("r");
    assert(cancelled_for_termination(f));
    assert(!pool.has("r"));
    assert(launcher->spawn_count() == 1);
  }
  std::cout << "  [PASS]\n";
}

void test_unknown_server_is_noop() {
  std::cout << "test_unknown_server_is_noop...\n";
  auto launcher = std::make_shared<FakeLauncher>();
  PoolOptions options;
  options.launcher = launcher;
  ProcessPool pool(options);
  pool.terminate("never-started");
  pool.terminate("never-started");
  assert(launcher->spawn_count() == 0);
  std::cout << "  [PASS]\n";
}

void test_terminate_is_not_a_crash() {
  std::cout << "test_terminate_is_not_a_crash...\n";
  auto launcher = std::make_shared<FakeLauncher>();
  PoolOptions options;
  options.launcher = launcher;
  ProcessPool pool(options);

  for (int i = 0; i < 5; ++i) {
    pool.call("t", fake_config(), request(i, "ping"));
    pool.terminate("t");
  }
  // Five stops in quick succession never trip the crash breaker
  auto proc = pool.get("t", fake_config());
  assert(proc->pid() == 1006);
  std::cout << "  [PASS]\n";
}

void test_terminate_all() {
  std::cout << "test_terminate_all...\n";
  auto launcher = std::make_shared<FakeLauncher>();
  PoolOptions options;
  options.launcher = launcher;
  ProcessPool pool(options);

  std::vector<std::string> ids = {"a", "b", "c"};
  for (const auto& id : ids) pool.get(id, fake_config());
  assert(pool.server_ids() == ids);

  pool.terminate_all();
  assert(pool.server_ids().empty());
  for (size_t i = 0; i < ids.size(); ++i) {
    assert(!pool.has(ids[i]));
    assert(launcher->at(i)->signals().size() == 1);
  }

  // The pool is still usable afterwards
  auto r = pool.call("a", fake_config(), request(1, "ping"));
  assert(r["result"]["pid"] == 1004);
  std::cout << "  [PASS]\n";
}

void test_destructor_stops_everything() {
  std::cout << "test_destructor_stops_everything...\n";
  auto launcher = hanging_launcher();
  std::future<Json> pending;
  {
    PoolOptions options;
    options.launcher = launcher;
    ProcessPool pool(options);
    pool.get("x", fake_config());
    pending = pool.send_request("x", fake_config(), request(1, "hang"));
    assert(wait_until([&]() { return count_of_hang(launcher) == 1; }));
  }
  assert(cancelled_for_termination(pending));
  assert(launcher->last()->signals().size() == 1);
  assert(launcher->last()->exit_code());
  std::cout << "  [PASS]\n";
}

int main() {
  mcpgate::log::set_level(mcpgate::log::Level::Error);
  test_graceful_stop_sends_only_sigterm();
  test_stubborn_process_gets_sigkill_after_grace();
  test_pending_and_queued_requests_cancelled();
  test_terminate_interrupts_retry_wait();
  test_terminate_during_rapid_retries_leaves_nothing_behind();
  test_unknown_server_is_noop();
  test_terminate_is_not_a_crash();
  test_terminate_all();
  test_destructor_stops_everything();
  std::cout << "All terminate tests passed\n";
  return 0;
}
