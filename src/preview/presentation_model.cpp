#include "preview/presentation_model.hpp"

#include <chrono>
#include <string>
#include <utility>

namespace pulsecam::preview {

namespace {

constexpr auto kDrainPollInterval = std::chrono::milliseconds(50);

} // namespace

PresentationModel::PresentationModel(capture::CaptureController& controller,
                                     IUpdateContext& context, core::logging::Logger& logger)
    : controller_(controller), context_(context), logger_(logger) {
  std::weak_ptr<UiFields> weak_fields = fields_;
  status_token_ = controller_.StatusPublisher().Subscribe(
      [this, weak_fields](const capture::CaptureStatus& status) {
        context_.Post([weak_fields, status] {
          if (auto fields = weak_fields.lock()) {
            std::lock_guard<std::mutex> lock(fields->mutex);
            fields->status = status;
          }
        });
      });

  drain_thread_ = std::thread([this] { DrainFrames(); });
}

PresentationModel::~PresentationModel() {
  controller_.StatusPublisher().Unsubscribe(status_token_);
  stop_requested_.store(true);
  if (drain_thread_.joinable()) {
    drain_thread_.join();
  }
}

void PresentationModel::DrainFrames() {
  auto& stream = controller_.PreviewStream();
  std::weak_ptr<UiFields> weak_fields = fields_;

  while (!stop_requested_.load()) {
    capture::Frame frame;
    if (!stream.NextFor(frame, kDrainPollInterval)) {
      if (stream.IsFinished()) {
        break;
      }
      continue;
    }

    PreviewImage image;
    std::string error;
    if (!ConvertFrameToPreview(frame, image, error)) {
      rejected_count_.fetch_add(1U);
      logger_.Warn("dropping frame that cannot be previewed",
                   {{"sequence", std::to_string(frame.sequence)}, {"error", error}});
      continue;
    }

    context_.Post([weak_fields, image = std::move(image)]() mutable {
      if (auto fields = weak_fields.lock()) {
        std::lock_guard<std::mutex> lock(fields->mutex);
        fields->image = std::move(image);
        ++fields->presented_count;
      }
    });
  }
}

capture::CaptureStatus PresentationModel::CameraStatus() const {
  std::lock_guard<std::mutex> lock(fields_->mutex);
  return fields_->status;
}

std::optional<PreviewImage> PresentationModel::ViewfinderImage() const {
  std::lock_guard<std::mutex> lock(fields_->mutex);
  return fields_->image;
}

std::size_t PresentationModel::PresentedFrameCount() const {
  std::lock_guard<std::mutex> lock(fields_->mutex);
  return fields_->presented_count;
}

std::size_t PresentationModel::RejectedFrameCount() const {
  return rejected_count_.load();
}

} // namespace pulsecam::preview
