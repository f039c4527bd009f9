#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace pulsecam::core::dispatch {

// Single worker thread executing submitted tasks one at a time in arrival
// order.
//
// `Suspend()`/`Resume()` are counted: while the count is non-zero no queued
// task begins (a task already running finishes normally). Destruction resets
// the count, runs everything still queued, then joins the worker.
class SerialQueue {
public:
  explicit SerialQueue(std::string label);
  ~SerialQueue();

  SerialQueue(const SerialQueue&) = delete;
  SerialQueue& operator=(const SerialQueue&) = delete;

  // Throws `std::runtime_error` once the queue is shutting down.
  void Async(std::function<void()> task);

  void Suspend();
  void Resume();
  bool IsSuspended() const;

  // True when called from a task running on this queue.
  bool IsCurrent() const;

  std::size_t PendingCount() const;
  const std::string& Label() const;

private:
  void WorkerLoop();

  const std::string label_;
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<std::function<void()>> tasks_;
  std::size_t suspend_count_ = 0U;
  bool stopping_ = false;
  std::thread worker_;
};

} // namespace pulsecam::core::dispatch
