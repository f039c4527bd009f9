#pragma once

#include "capture/capture_device.hpp"
#include "capture/frame.hpp"
#include "core/logging/logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace pulsecam::capture {

// Session output that hands every captured frame to a delegate.
//
// The delegate runs on the output's own delivery thread, which exists only
// while the owning session runs. It never runs on the session queue.
class VideoDataOutput {
public:
  using SampleDelegate = std::function<void(Frame&& frame)>;

  VideoDataOutput(core::logging::Logger& logger, std::chrono::milliseconds wait_timeout);
  ~VideoDataOutput();

  VideoDataOutput(const VideoDataOutput&) = delete;
  VideoDataOutput& operator=(const VideoDataOutput&) = delete;

  void SetSampleDelegate(SampleDelegate delegate);
  bool HasSampleDelegate() const;

  // Called by `CaptureSession` once the device streams.
  bool BeginDelivery(ICaptureDevice& device, std::string& error);
  // Joins the delivery thread. Safe to call when not delivering.
  void EndDelivery();
  bool IsDelivering() const;

  std::uint64_t DeliveredCount() const;

private:
  void DeliveryLoop(ICaptureDevice* device);

  core::logging::Logger& logger_;
  const std::chrono::milliseconds wait_timeout_;
  mutable std::mutex delegate_mutex_;
  SampleDelegate delegate_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<std::uint64_t> delivered_count_{0U};
  std::thread delivery_thread_;
};

} // namespace pulsecam::capture
