#include "preview/update_context.hpp"

#include <utility>

namespace pulsecam::preview {

void MainLoopContext::Post(std::function<void()> update) {
  if (!update) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  pending_.push_back(std::move(update));
}

std::size_t MainLoopContext::RunPending() {
  std::deque<std::function<void()>> batch;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    batch.swap(pending_);
  }
  for (auto& update : batch) {
    update();
  }
  return batch.size();
}

std::size_t MainLoopContext::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

} // namespace pulsecam::preview
