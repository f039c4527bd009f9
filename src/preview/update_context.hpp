#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

namespace pulsecam::preview {

// Where UI-visible state changes run. `Post` may be called from any thread.
class IUpdateContext {
public:
  virtual ~IUpdateContext() = default;

  virtual void Post(std::function<void()> update) = 0;
};

// Update context drained by the UI loop itself: posted work runs, in post
// order, inside `RunPending` on the calling thread.
class MainLoopContext final : public IUpdateContext {
public:
  void Post(std::function<void()> update) override;

  // Runs everything posted so far and returns how many updates ran. Updates
  // posted while running wait for the next call.
  std::size_t RunPending();

  std::size_t PendingCount() const;

private:
  mutable std::mutex mutex_;
  std::deque<std::function<void()>> pending_;
};

} // namespace pulsecam::preview
