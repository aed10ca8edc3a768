#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include <trailfx/event_channel.hpp>

using namespace trailfx;

TEST_CASE("EventChannel delivers to subscribers in order") {
  EventChannel<int> ch;
  std::vector<std::string> log;

  ch.subscribe([&](int v){ log.push_back("a" + std::to_string(v)); });
  ch.subscribe([&](int v){ log.push_back("b" + std::to_string(v)); });
  REQUIRE(ch.subscriber_count() == 2);

  ch.publish(1);
  ch.publish(2);
  REQUIRE(log == std::vector<std::string>{"a1", "b1", "a2", "b2"});
}

TEST_CASE("EventChannel unsubscribe stops delivery") {
  EventChannel<float, double> ch;
  int first = 0, second = 0;
  const auto id1 = ch.subscribe([&](float, double){ ++first; });
  const auto id2 = ch.subscribe([&](float, double){ ++second; });
  REQUIRE(id1 != id2);

  ch.publish(1.0f, 2.0);
  REQUIRE(ch.unsubscribe(id1));
  REQUIRE_FALSE(ch.unsubscribe(id1)); // already gone
  ch.publish(1.0f, 3.0);

  REQUIRE(first == 1);
  REQUIRE(second == 2);
  REQUIRE(ch.subscriber_count() == 1);
}

TEST_CASE("EventChannel publish without subscribers is a no-op") {
  EventChannel<> ch;
  REQUIRE(ch.subscriber_count() == 0);
  ch.publish();
  REQUIRE_FALSE(ch.unsubscribe(12345));
}
