#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <thread>

#include "mcpgate/exceptions.hpp"
#include "mcpgate/stdio/request_queue.hpp"

using mcpgate::Json;
using mcpgate::stdio::QueuedRequest;
using mcpgate::stdio::RequestQueue;
using mcpgate::stdio::RetryPolicy;
using namespace std::chrono_literals;

static QueuedRequest make_item(int id) {
  QueuedRequest item;
  item.request = Json{{"jsonrpc", "2.0"}, {"id", id}, {"method", "ping"}};
  return item;
}

void test_fifo_with_front_insertion() {
  std::cout << "test_fifo_with_front_insertion...\n";
  RequestQueue q;
  for (int i = 1; i <= 3; ++i) {
    auto item = make_item(i);
    assert(q.push_back(item));
  }
  auto retry = make_item(0);
  retry.retry_count = 1;
  assert(q.push_front(retry));
  assert(q.size() == 4);

  int expected[] = {0, 1, 2, 3};
  for (int id : expected) {
    auto item = q.pop();
    assert(item);
    assert(item->request["id"] == id);
  }
  assert(q.size() == 0);
  std::cout << "  [PASS]\n";
}

void test_pop_blocks_until_push() {
  std::cout << "test_pop_blocks_until_push...\n";
  RequestQueue q;
  auto popped = std::async(std::launch::async, [&q]() { return q.pop(); });
  assert(popped.wait_for(50ms) == std::future_status::timeout);
  auto item = make_item(11);
  q.push_back(item);
  auto got = popped.get();
  assert(got && got->request["id"] == 11);
  std::cout << "  [PASS]\n";
}

void test_close_hands_back_items_and_wakes_consumer() {
  std::cout << "test_close_hands_back_items_and_wakes_consumer...\n";
  RequestQueue waiting;
  auto popped = std::async(std::launch::async, [&waiting]() { return waiting.pop(); });
  std::this_thread::sleep_for(20ms);
  assert(waiting.close().empty());
  assert(!popped.get());

  RequestQueue q;
  auto a = make_item(1);
  auto b = make_item(2);
  q.push_back(a);
  q.push_back(b);
  auto rest = q.close();
  assert(rest.size() == 2);
  assert(rest[0].request["id"] == 1);
  assert(q.closed());

  // Rejected pushes leave the item (and its promise) with the caller
  auto late = make_item(3);
  auto fut = late.promise.get_future();
  assert(!q.push_back(late));
  assert(!q.push_front(late));
  late.promise.set_value(Json{{"rejected", true}});
  assert(fut.get()["rejected"] == true);
  std::cout << "  [PASS]\n";
}

void test_retry_classification() {
  std::cout << "test_retry_classification...\n";
  using mcpgate::ProcessExitedError;
  using mcpgate::RequestCancelledError;
  using mcpgate::RequestTimeoutError;
  using mcpgate::StreamUnavailableError;

  assert(RetryPolicy::is_retryable(std::make_exception_ptr(RequestTimeoutError("1", 10ms))));
  assert(RetryPolicy::is_retryable(std::make_exception_ptr(StreamUnavailableError("stdin gone"))));
  assert(RetryPolicy::is_retryable(std::make_exception_ptr(ProcessExitedError("1", "exit 1"))));

  assert(!RetryPolicy::is_retryable(std::make_exception_ptr(RequestCancelledError("1", "terminating"))));
  assert(!RetryPolicy::is_retryable(std::make_exception_ptr(mcpgate::DuplicateRequestIdError("1"))));
  assert(!RetryPolicy::is_retryable(std::make_exception_ptr(mcpgate::HandshakeError("bad"))));
  assert(!RetryPolicy::is_retryable(std::make_exception_ptr(mcpgate::SpawnError("ENOENT"))));
  assert(!RetryPolicy::is_retryable(std::make_exception_ptr(std::runtime_error("other"))));
  assert(!RetryPolicy::is_retryable(nullptr));

  RetryPolicy policy;
  assert(policy.max_retries == 3);
  assert(policy.delay == 1000ms);
  auto item = make_item(1);
  auto timeout = std::make_exception_ptr(RequestTimeoutError("1", 10ms));
  for (int i = 0; i < 3; ++i) {
    assert(policy.should_retry(item, timeout));
    item.retry_count++;
  }
  assert(!policy.should_retry(item, timeout));
  std::cout << "  [PASS]\n";
}

int main() {
  test_fifo_with_front_insertion();
  test_pop_blocks_until_push();
  test_close_hands_back_items_and_wakes_consumer();
  test_retry_classification();
  std::cout << "All request queue tests passed\n";
  return 0;
}
