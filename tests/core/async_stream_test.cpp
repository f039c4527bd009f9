#include "core/async/async_stream.hpp"
#include "core/async/published.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using pulsecam::core::async::AsyncStream;
using pulsecam::core::async::BufferingPolicy;
using pulsecam::core::async::YieldResult;

TEST_CASE("Unbounded stream delivers every value in order", "[core][async]") {
  AsyncStream<int> stream(BufferingPolicy::Unbounded());
  for (int i = 0; i < 100; ++i) {
    REQUIRE(stream.Yield(i) == YieldResult::kEnqueued);
  }
  stream.Finish();

  std::vector<int> received;
  int value = 0;
  while (stream.Next(value)) {
    received.push_back(value);
  }
  REQUIRE(received.size() == 100U);
  for (int i = 0; i < 100; ++i) {
    REQUIRE(received[static_cast<std::size_t>(i)] == i);
  }
  REQUIRE(stream.DroppedCount() == 0U);
}

TEST_CASE("Newest-buffering stream drops the oldest values", "[core][async]") {
  AsyncStream<int> stream(BufferingPolicy::BufferingNewest(2));
  REQUIRE(stream.Yield(1) == YieldResult::kEnqueued);
  REQUIRE(stream.Yield(2) == YieldResult::kEnqueued);
  REQUIRE(stream.Yield(3) == YieldResult::kEnqueuedDroppingOldest);

  int value = 0;
  REQUIRE(stream.TryNext(value));
  REQUIRE(value == 2);
  REQUIRE(stream.TryNext(value));
  REQUIRE(value == 3);
  REQUIRE_FALSE(stream.TryNext(value));
  REQUIRE(stream.YieldedCount() == 3U);
  REQUIRE(stream.DroppedCount() == 1U);
}

TEST_CASE("Finished stream rejects new values and drains the rest", "[core][async]") {
  AsyncStream<std::string> stream(BufferingPolicy::Unbounded());
  REQUIRE(stream.Yield("a") == YieldResult::kEnqueued);
  stream.Finish();
  REQUIRE(stream.IsFinished());
  REQUIRE(stream.Yield("b") == YieldResult::kTerminated);

  std::string value;
  REQUIRE(stream.Next(value));
  REQUIRE(value == "a");
  REQUIRE_FALSE(stream.Next(value));
}

TEST_CASE("Next wakes up for values from another thread", "[core][async]") {
  AsyncStream<int> stream(BufferingPolicy::Unbounded());
  std::thread producer([&stream] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    (void)stream.Yield(7);
    stream.Finish();
  });

  int value = 0;
  REQUIRE(stream.Next(value));
  REQUIRE(value == 7);
  REQUIRE_FALSE(stream.Next(value));
  producer.join();
}

TEST_CASE("NextFor times out on an open empty stream", "[core][async]") {
  AsyncStream<int> stream(BufferingPolicy::Unbounded());
  int value = 0;
  REQUIRE_FALSE(stream.NextFor(value, std::chrono::milliseconds(10)));
  REQUIRE_FALSE(stream.IsFinished());
}

TEST_CASE("Buffering policies parse from text", "[core][async]") {
  BufferingPolicy policy;
  std::string error;
  REQUIRE(pulsecam::core::async::ParseBufferingPolicy("newest:3", policy, error));
  REQUIRE(policy.kind == BufferingPolicy::Kind::kBufferingNewest);
  REQUIRE(policy.limit == 3U);
  REQUIRE(pulsecam::core::async::ToString(policy) == "newest:3");

  REQUIRE(pulsecam::core::async::ParseBufferingPolicy("unbounded", policy, error));
  REQUIRE(policy.kind == BufferingPolicy::Kind::kUnbounded);

  REQUIRE_FALSE(pulsecam::core::async::ParseBufferingPolicy("newest:0", policy, error));
  REQUIRE_FALSE(pulsecam::core::async::ParseBufferingPolicy("newest:", policy, error));
  REQUIRE_FALSE(pulsecam::core::async::ParseBufferingPolicy("latest", policy, error));
  REQUIRE(error.find("unbounded|newest:<n>") != std::string::npos);
}

TEST_CASE("Published replays the current value and then every change", "[core][async]") {
  pulsecam::core::async::Published<int> published(1);
  std::vector<int> seen;
  const auto token = published.Subscribe([&seen](const int& value) { seen.push_back(value); });

  published.Set(2);
  published.Set(3);
  published.Unsubscribe(token);
  published.Set(4);

  REQUIRE(seen == std::vector<int>{1, 2, 3});
  REQUIRE(published.Get() == 4);
}
