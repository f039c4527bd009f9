#pragma once

#include "capture/capture_controller.hpp"
#include "capture/capture_status.hpp"
#include "core/logging/logger.hpp"
#include "preview/preview_image.hpp"
#include "preview/update_context.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace pulsecam::preview {

// UI-facing mirror of a `CaptureController`.
//
// Status changes and converted preview images reach the UI fields only through
// `IUpdateContext::Post`, so readers on the UI loop see them in order. Frames
// are drained from the controller's preview stream on a dedicated thread.
//
// Must be destroyed before the controller it observes.
class PresentationModel {
public:
  PresentationModel(capture::CaptureController& controller, IUpdateContext& context,
                    core::logging::Logger& logger);
  ~PresentationModel();

  PresentationModel(const PresentationModel&) = delete;
  PresentationModel& operator=(const PresentationModel&) = delete;

  capture::CaptureStatus CameraStatus() const;
  std::optional<PreviewImage> ViewfinderImage() const;

  // Images published to the UI fields so far.
  std::size_t PresentedFrameCount() const;
  // Frames the drain thread could not convert.
  std::size_t RejectedFrameCount() const;

  capture::CaptureController& Controller() {
    return controller_;
  }

private:
  // Shared with posted updates so a late update never touches a destroyed
  // model.
  struct UiFields {
    mutable std::mutex mutex;
    capture::CaptureStatus status = capture::CaptureStatus::kUninitialized;
    std::optional<PreviewImage> image;
    std::size_t presented_count = 0U;
  };

  void DrainFrames();

  capture::CaptureController& controller_;
  IUpdateContext& context_;
  core::logging::Logger& logger_;
  std::shared_ptr<UiFields> fields_ = std::make_shared<UiFields>();
  core::async::Published<capture::CaptureStatus>::Token status_token_ = 0U;

  std::atomic<bool> stop_requested_{false};
  std::atomic<std::size_t> rejected_count_{0U};
  std::thread drain_thread_;
};

} // namespace pulsecam::preview
