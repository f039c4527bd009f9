#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <utility>

namespace pulsecam::core::async {

// Observable value. A new subscriber is called with the current value right
// away and then once per `Set`, in `Set` order.
//
// Subscribers run on the thread that calls `Set` (or `Subscribe` for the
// initial value) and must not call back into `Set`/`Subscribe` on the same
// object. `Get` is safe from anywhere.
template <typename T>
class Published {
public:
  using Subscriber = std::function<void(const T&)>;
  using Token = std::size_t;

  explicit Published(T initial) : value_(std::move(initial)) {}

  Published(const Published&) = delete;
  Published& operator=(const Published&) = delete;

  T Get() const {
    std::lock_guard<std::mutex> lock(value_mutex_);
    return value_;
  }

  void Set(T value) {
    std::lock_guard<std::mutex> delivery_lock(delivery_mutex_);
    {
      std::lock_guard<std::mutex> lock(value_mutex_);
      value_ = value;
    }
    for (const auto& [token, subscriber] : subscribers_) {
      (void)token;
      subscriber(value);
    }
  }

  Token Subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> delivery_lock(delivery_mutex_);
    const Token token = next_token_++;
    subscriber(Get());
    subscribers_.emplace(token, std::move(subscriber));
    return token;
  }

  void Unsubscribe(Token token) {
    std::lock_guard<std::mutex> delivery_lock(delivery_mutex_);
    subscribers_.erase(token);
  }

private:
  mutable std::mutex value_mutex_;
  std::mutex delivery_mutex_;
  T value_;
  std::map<Token, Subscriber> subscribers_;
  Token next_token_ = 1U;
};

} // namespace pulsecam::core::async
