#include "EventQueue.hpp"
#include "TestHeaders.hpp"

using namespace apc;

namespace {
const function<bool()> NEVER = [] { return false; };
}

TEST_CASE("EventQueue keeps order and drains after close", "[EventQueue]") {
  EventQueue<int> queue(4);
  REQUIRE(queue.push(1, NEVER));
  REQUIRE(queue.tryPush(2));
  REQUIRE(queue.forcePush(3));
  queue.close();
  REQUIRE_FALSE(queue.tryPush(4));
  REQUIRE_FALSE(queue.forcePush(4));

  int value;
  REQUIRE(queue.pop(&value));
  REQUIRE(value == 1);
  REQUIRE(queue.pop(&value));
  REQUIRE(value == 2);
  REQUIRE(queue.popFor(&value, chrono::milliseconds(10)));
  REQUIRE(value == 3);
  REQUIRE_FALSE(queue.pop(&value));
}

TEST_CASE("EventQueue enforces its capacity", "[EventQueue]") {
  EventQueue<int> queue(2);
  REQUIRE(queue.tryPush(1));
  REQUIRE(queue.tryPush(2));
  REQUIRE_FALSE(queue.tryPush(3));
  // Control messages go past the limit
  REQUIRE(queue.forcePush(4));
  REQUIRE(queue.size() == 3);
  REQUIRE_THROWS_AS(EventQueue<int>(0), std::invalid_argument);
}

TEST_CASE("EventQueue popFor gives up when empty", "[EventQueue]") {
  EventQueue<int> queue(1);
  int value;
  auto start = chrono::steady_clock::now();
  REQUIRE_FALSE(queue.popFor(&value, chrono::milliseconds(50)));
  REQUIRE(chrono::steady_clock::now() - start >= chrono::milliseconds(50));
}

TEST_CASE("EventQueue producers wait for room", "[EventQueue]") {
  EventQueue<int> queue(1);
  REQUIRE(queue.tryPush(1));
  atomic<bool> pushed(false);
  std::thread producer([&]() {
    queue.push(2, NEVER);
    pushed = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE_FALSE(pushed);

  int value;
  REQUIRE(queue.pop(&value));
  REQUIRE(value == 1);
  producer.join();
  REQUIRE(pushed);
  REQUIRE(queue.pop(&value));
  REQUIRE(value == 2);
}

TEST_CASE("EventQueue blocked producers can be interrupted", "[EventQueue]") {
  EventQueue<int> queue(1);
  REQUIRE(queue.tryPush(1));
  atomic<bool> stop(false);
  atomic<int> result(-1);
  std::thread producer(
      [&]() { result = queue.push(2, [&] { return stop.load(); }) ? 1 : 0; });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  stop = true;
  queue.wakeProducers();
  producer.join();
  REQUIRE(result == 0);
  REQUIRE(queue.size() == 1);
}

TEST_CASE("EventQueue close wakes consumers and producers", "[EventQueue]") {
  EventQueue<int> empty(1);
  std::thread consumer([&]() {
    int value;
    REQUIRE_FALSE(empty.pop(&value));
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  empty.close();
  consumer.join();

  EventQueue<int> full(1);
  REQUIRE(full.tryPush(1));
  atomic<int> result(-1);
  std::thread producer([&]() { result = full.push(2, NEVER) ? 1 : 0; });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  full.close();
  producer.join();
  REQUIRE(result == 0);
  REQUIRE(full.isClosed());
}
