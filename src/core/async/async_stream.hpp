#pragma once

#include <charconv>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace pulsecam::core::async {

// How an `AsyncStream` buffers values the consumer has not taken yet.
//
// - unbounded: every yield is kept; memory grows with consumer lag
// - buffering newest: at most `limit` values are kept; a yield into a full
//   buffer evicts the oldest value and counts it as dropped
struct BufferingPolicy {
  enum class Kind {
    kUnbounded = 0,
    kBufferingNewest,
  };

  Kind kind = Kind::kUnbounded;
  std::size_t limit = 0U;

  static BufferingPolicy Unbounded() {
    return BufferingPolicy{};
  }

  static BufferingPolicy BufferingNewest(std::size_t limit) {
    return BufferingPolicy{.kind = Kind::kBufferingNewest, .limit = limit};
  }
};

inline std::string ToString(const BufferingPolicy& policy) {
  if (policy.kind == BufferingPolicy::Kind::kBufferingNewest) {
    return "newest:" + std::to_string(policy.limit);
  }
  return "unbounded";
}

// Accepts `unbounded` or `newest:<n>` with n >= 1.
inline bool ParseBufferingPolicy(std::string_view text, BufferingPolicy& policy,
                                 std::string& error) {
  error.clear();
  if (text == "unbounded") {
    policy = BufferingPolicy::Unbounded();
    return true;
  }

  constexpr std::string_view kNewestPrefix = "newest:";
  if (text.substr(0, kNewestPrefix.size()) == kNewestPrefix) {
    const std::string_view digits = text.substr(kNewestPrefix.size());
    std::size_t limit = 0U;
    const char* begin = digits.data();
    const char* end = begin + digits.size();
    const auto [ptr, ec] = std::from_chars(begin, end, limit);
    if (!digits.empty() && ec == std::errc() && ptr == end && limit > 0U) {
      policy = BufferingPolicy::BufferingNewest(limit);
      return true;
    }
  }

  error = "invalid buffering policy '" + std::string(text) +
          "' (expected unbounded|newest:<n> with n >= 1)";
  return false;
}

enum class YieldResult {
  kEnqueued = 0,
  kEnqueuedDroppingOldest,
  kTerminated,
};

// Single-producer, single-consumer push stream.
//
// Yields never block. Values reach the consumer in yield order. The stream is
// not safe for more than one consumer: concurrent `Next` callers would split
// the sequence between them.
template <typename T>
class AsyncStream {
public:
  explicit AsyncStream(BufferingPolicy policy = BufferingPolicy::Unbounded())
      : policy_(policy) {}

  AsyncStream(const AsyncStream&) = delete;
  AsyncStream& operator=(const AsyncStream&) = delete;

  YieldResult Yield(T value) {
    YieldResult result = YieldResult::kEnqueued;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (finished_) {
        return YieldResult::kTerminated;
      }
      if (policy_.kind == BufferingPolicy::Kind::kBufferingNewest && policy_.limit > 0U &&
          buffer_.size() >= policy_.limit) {
        buffer_.pop_front();
        ++dropped_count_;
        result = YieldResult::kEnqueuedDroppingOldest;
      }
      buffer_.push_back(std::move(value));
      ++yielded_count_;
    }
    condition_.notify_one();
    return result;
  }

  // Ends the stream. Buffered values are still delivered before `Next`
  // reports the end.
  void Finish() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      finished_ = true;
    }
    condition_.notify_all();
  }

  // Blocks until a value is available (true) or the stream has finished and
  // drained (false).
  bool Next(T& value) {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this] { return finished_ || !buffer_.empty(); });
    return PopLocked(value);
  }

  // Like `Next`, but gives up after `timeout` and returns false with the
  // stream still open.
  template <typename Rep, typename Period>
  bool NextFor(T& value, std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait_for(lock, timeout, [this] { return finished_ || !buffer_.empty(); });
    return PopLocked(value);
  }

  bool TryNext(T& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    return PopLocked(value);
  }

  bool IsFinished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
  }

  std::size_t BufferedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
  }

  std::size_t YieldedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return yielded_count_;
  }

  // Always zero under the unbounded policy.
  std::size_t DroppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_count_;
  }

  const BufferingPolicy& Policy() const {
    return policy_;
  }

private:
  bool PopLocked(T& value) {
    if (buffer_.empty()) {
      return false;
    }
    value = std::move(buffer_.front());
    buffer_.pop_front();
    return true;
  }

  const BufferingPolicy policy_;
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> buffer_;
  std::size_t yielded_count_ = 0U;
  std::size_t dropped_count_ = 0U;
  bool finished_ = false;
};

} // namespace pulsecam::core::async
