#include "capture/video_data_output.hpp"

#include <utility>

namespace pulsecam::capture {

namespace {

constexpr std::chrono::milliseconds kWaitFailureBackoff(5);

} // namespace

VideoDataOutput::VideoDataOutput(core::logging::Logger& logger,
                                 const std::chrono::milliseconds wait_timeout)
    : logger_(logger),
      wait_timeout_(wait_timeout > std::chrono::milliseconds::zero()
                        ? wait_timeout
                        : std::chrono::milliseconds(1)) {}

VideoDataOutput::~VideoDataOutput() {
  EndDelivery();
}

void VideoDataOutput::SetSampleDelegate(SampleDelegate delegate) {
  std::lock_guard<std::mutex> lock(delegate_mutex_);
  delegate_ = std::move(delegate);
}

bool VideoDataOutput::HasSampleDelegate() const {
  std::lock_guard<std::mutex> lock(delegate_mutex_);
  return static_cast<bool>(delegate_);
}

bool VideoDataOutput::BeginDelivery(ICaptureDevice& device, std::string& error) {
  error.clear();
  if (delivery_thread_.joinable()) {
    error = "video data output is already delivering";
    return false;
  }
  stop_requested_.store(false);
  delivery_thread_ = std::thread([this, &device] { DeliveryLoop(&device); });
  return true;
}

void VideoDataOutput::EndDelivery() {
  stop_requested_.store(true);
  if (delivery_thread_.joinable()) {
    delivery_thread_.join();
  }
}

bool VideoDataOutput::IsDelivering() const {
  return delivery_thread_.joinable();
}

std::uint64_t VideoDataOutput::DeliveredCount() const {
  return delivered_count_.load();
}

void VideoDataOutput::DeliveryLoop(ICaptureDevice* device) {
  logger_.Debug("frame delivery started", {{"device", device->Info().device_path}});
  while (!stop_requested_.load()) {
    Frame frame;
    std::string error;
    const FrameWaitResult result = device->WaitForFrame(wait_timeout_, frame, error);
    if (result == FrameWaitResult::kTimeout) {
      continue;
    }
    if (result == FrameWaitResult::kError) {
      logger_.Warn("frame wait failed", {{"error", error}});
      std::this_thread::sleep_for(kWaitFailureBackoff);
      continue;
    }

    SampleDelegate delegate;
    {
      std::lock_guard<std::mutex> lock(delegate_mutex_);
      delegate = delegate_;
    }
    ++delivered_count_;
    if (delegate) {
      delegate(std::move(frame));
    }
  }
  logger_.Debug("frame delivery stopped",
                {{"delivered", std::to_string(delivered_count_.load())}});
}

} // namespace pulsecam::capture
