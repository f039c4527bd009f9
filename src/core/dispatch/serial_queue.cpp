#include "core/dispatch/serial_queue.hpp"

#include <stdexcept>
#include <utility>

namespace pulsecam::core::dispatch {

SerialQueue::SerialQueue(std::string label) : label_(std::move(label)) {
  worker_ = std::thread([this] { WorkerLoop(); });
}

SerialQueue::~SerialQueue() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    suspend_count_ = 0U;
  }
  condition_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void SerialQueue::Async(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      throw std::runtime_error("submit on stopped serial queue '" + label_ + "'");
    }
    tasks_.push_back(std::move(task));
  }
  condition_.notify_one();
}

void SerialQueue::Suspend() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++suspend_count_;
}

void SerialQueue::Resume() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (suspend_count_ == 0U) {
      return;
    }
    --suspend_count_;
  }
  condition_.notify_all();
}

bool SerialQueue::IsSuspended() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return suspend_count_ != 0U;
}

bool SerialQueue::IsCurrent() const {
  return std::this_thread::get_id() == worker_.get_id();
}

std::size_t SerialQueue::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

const std::string& SerialQueue::Label() const {
  return label_;
}

void SerialQueue::WorkerLoop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      condition_.wait(lock, [this] {
        return (stopping_ && tasks_.empty()) || (suspend_count_ == 0U && !tasks_.empty());
      });
      if (stopping_ && tasks_.empty()) {
        return;
      }
      task = std::move(tasks_.front());
      tasks_.pop_front();
    }
    task();
  }
}

} // namespace pulsecam::core::dispatch
