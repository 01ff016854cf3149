#include <catch2/catch.hpp>

#include "gateway/relay_channel.h"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using chatbridge::HandoffChannel;

TEST_CASE("HandoffChannel hands values over in order", "[relay_channel]") {
  HandoffChannel<int> channel;
  std::thread producer([&channel] {
    for (int i = 0; i < 100; ++i) {
      REQUIRE(channel.Send(i));
    }
    channel.Close();
  });
  std::vector<int> received;
  while (auto value = channel.Receive()) {
    received.push_back(*value);
  }
  producer.join();
  REQUIRE(received.size() == 100);
  for (int i = 0; i < 100; ++i) {
    REQUIRE(received[i] == i);
  }
}

TEST_CASE("HandoffChannel blocks the producer until the slot is taken",
          "[relay_channel]") {
  HandoffChannel<int> channel;
  REQUIRE(channel.Send(1));
  std::atomic<bool> second_sent{false};
  std::thread producer([&] {
    channel.Send(2);
    second_sent = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE_FALSE(second_sent.load());
  REQUIRE(*channel.Receive() == 1);
  REQUIRE(*channel.Receive() == 2);
  producer.join();
  REQUIRE(second_sent.load());
}

TEST_CASE("HandoffChannel drains the slot after Close", "[relay_channel]") {
  HandoffChannel<int> channel;
  REQUIRE(channel.Send(7));
  channel.Close();
  REQUIRE(channel.closed());
  REQUIRE_FALSE(channel.Send(8));
  auto value = channel.Receive();
  REQUIRE(value.has_value());
  REQUIRE(*value == 7);
  REQUIRE_FALSE(channel.Receive().has_value());
}

TEST_CASE("HandoffChannel Close releases a blocked sender", "[relay_channel]") {
  HandoffChannel<int> channel;
  REQUIRE(channel.Send(1));
  std::atomic<bool> result{true};
  std::thread producer([&] { result = channel.Send(2); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  channel.Close();
  producer.join();
  REQUIRE_FALSE(result.load());
}
