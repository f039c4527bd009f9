#include "capture/capture_controller.hpp"

#include "capture/device_selection.hpp"

#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

namespace pulsecam::capture {

namespace {

std::string FormatFrameRate(const double fps) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << fps;
  return out.str();
}

std::string FormatResolution(const std::optional<CaptureFormat>& format) {
  if (!format.has_value()) {
    return "unknown";
  }
  return std::to_string(format->width) + "x" + std::to_string(format->height);
}

} // namespace

CaptureController::CaptureController(ICaptureDeviceProvider& provider,
                                     IAuthorizationProvider& authorization,
                                     core::logging::Logger& logger,
                                     CaptureControllerOptions options)
    : logger_(logger),
      authorization_(authorization),
      options_(std::move(options)),
      preview_stream_(options_.frame_buffering) {
  session_ = std::make_unique<CaptureSession>(logger_);

  std::vector<CaptureDeviceInfo> devices;
  std::string error;
  if (!provider.EnumerateDevices(devices, error)) {
    logger_.Error("capture device enumeration failed", {{"error", error}});
    RecordError(CaptureErrorCode::kNoEligibleDevice, "enumeration failed: " + error);
    return;
  }

  const std::optional<std::size_t> selected = SelectCaptureDevice(devices);
  if (!selected.has_value()) {
    logger_.Error("failed to obtain capture device",
                  {{"candidates", std::to_string(devices.size())}});
    RecordError(CaptureErrorCode::kNoEligibleDevice,
                "no connected back-facing device with a torch among " +
                    std::to_string(devices.size()) + " candidate(s)");
    return;
  }

  const CaptureDeviceInfo& info = devices[selected.value()];
  device_ = provider.OpenDevice(info, error);
  if (device_ == nullptr) {
    logger_.Error("failed to open capture device",
                  {{"device", info.device_path}, {"error", error}});
    RecordError(CaptureErrorCode::kDeviceOpenFailed, info.device_path + ": " + error);
    return;
  }
  logger_.Debug("using capture device",
                {{"device", info.device_path}, {"name", device_->Info().name}});

  output_ = std::make_unique<VideoDataOutput>(logger_, options_.frame_wait_timeout);
  RefreshConfigurationSnapshot();

  session_queue_.Async([this] { ConfigureSession(); });
}

CaptureController::~CaptureController() {
  session_queue_.Async([this] {
    if (session_->IsRunning()) {
      StopOnSessionQueue();
    }
    preview_stream_.Finish();
  });
}

void CaptureController::ConfigureSession() {
  ScopedSessionConfiguration configuration(*session_);

  if (!session_->CanAddInput(device_.get())) {
    logger_.Error("unable to add video capture device input to capture session");
    RecordError(CaptureErrorCode::kInputRejected, "session rejected device input");
    return;
  }
  if (!session_->CanAddOutput(output_.get())) {
    logger_.Error("unable to add video output to capture session");
    RecordError(CaptureErrorCode::kOutputRejected, "session rejected video output");
    return;
  }

  std::vector<CaptureFormat> formats;
  std::string error;
  if (!device_->EnumerateFormats(formats, error)) {
    logger_.Warn("capture format enumeration failed", {{"error", error}});
    formats.clear();
  }

  if (const std::optional<CaptureFormatChoice> choice = ChooseCaptureFormat(formats);
      choice.has_value()) {
    (void)ConfigureCaptureDevice(
        [this, &choice](ICaptureDevice& device, std::string& apply_error) {
          return ApplyCaptureFormat(device, choice.value(), apply_error);
        },
        CaptureErrorCode::kFormatApplyFailed, "apply capture format");
  } else {
    logger_.Warn("no capture format advertises a frame rate; keeping driver defaults",
                 {{"format_count", std::to_string(formats.size())}});
  }

  const DeviceConfiguration applied = device_->ActiveConfiguration();
  logger_.Debug("capture device framerate", {{"fps", FormatFrameRate(applied.FrameRate())}});
  logger_.Debug("capture device resolution",
                {{"resolution", FormatResolution(applied.active_format)}});

  output_->SetSampleDelegate([this](Frame&& frame) { HandleSample(std::move(frame)); });
  if (!session_->AddInput(device_.get(), error)) {
    logger_.Error("adding capture input failed", {{"error", error}});
    RecordError(CaptureErrorCode::kInputRejected, error);
    return;
  }
  if (!session_->AddOutput(output_.get(), error)) {
    logger_.Error("adding video output failed", {{"error", error}});
    RecordError(CaptureErrorCode::kOutputRejected, error);
    return;
  }
  RefreshConfigurationSnapshot();
}

bool CaptureController::ApplyCaptureFormat(ICaptureDevice& device,
                                           const CaptureFormatChoice& choice,
                                           std::string& error) {
  if (!device.SetActiveFormat(choice.format, error)) {
    error = "set active format " + Describe(choice.format) + ": " + error;
    return false;
  }

  std::string zoom_error;
  if (!device.SetZoomToMaximum(zoom_error)) {
    logger_.Debug("zoom left unchanged", {{"reason", zoom_error}});
  }

  // Pin the frame rate to the range maximum.
  const FrameDuration duration = choice.range.min_frame_duration;
  if (!device.SetFrameDurations(duration, duration, error)) {
    error = "set frame duration: " + error;
    return false;
  }

  std::lock_guard<std::mutex> lock(state_mutex_);
  frame_rate_ = choice.range.MaxFrameRate();
  return true;
}

void CaptureController::Start() {
  if (!CheckAuthorization()) {
    RecordError(CaptureErrorCode::kAuthorizationDenied,
                std::string("camera access ") + ToString(authorization_.Status()));
    status_.Set(CaptureStatus::kUnauthorized);
    return;
  }

  auto completion = std::make_shared<std::promise<void>>();
  std::future<void> done = completion->get_future();
  session_queue_.Async([this, completion] {
    StartOnSessionQueue();
    completion->set_value();
  });
  done.wait();
}

void CaptureController::Stop() {
  auto completion = std::make_shared<std::promise<void>>();
  std::future<void> done = completion->get_future();
  session_queue_.Async([this, completion] {
    StopOnSessionQueue();
    completion->set_value();
  });
  done.wait();
}

std::future<void> CaptureController::StartAsync() {
  return std::async(std::launch::async, [this] { Start(); });
}

std::future<void> CaptureController::StopAsync() {
  return std::async(std::launch::async, [this] { Stop(); });
}

bool CaptureController::CheckAuthorization() {
  switch (authorization_.Status()) {
  case AuthorizationStatus::kAuthorized:
    logger_.Debug("camera access authorized");
    return true;
  case AuthorizationStatus::kNotDetermined: {
    logger_.Debug("camera access not determined");
    // Hold session work back while the request is pending.
    session_queue_.Suspend();
    const bool granted = authorization_.RequestAccess();
    session_queue_.Resume();
    return granted;
  }
  case AuthorizationStatus::kDenied:
    logger_.Debug("camera access denied");
    return false;
  case AuthorizationStatus::kRestricted:
    logger_.Debug("camera access restricted");
    return false;
  case AuthorizationStatus::kUnknown:
    return false;
  }
  return false;
}

void CaptureController::StartOnSessionQueue() {
  if (!session_->HasInputs()) {
    status_.Set(CaptureStatus::kMissingDevice);
    return;
  }
  if (session_->IsRunning()) {
    return;
  }

  std::string error;
  if (!session_->StartRunning(error)) {
    logger_.Error("capture session failed to start", {{"error", error}});
    RecordError(CaptureErrorCode::kSessionStartFailed, error);
    return;
  }

  (void)ConfigureCaptureDevice(
      [](ICaptureDevice& device, std::string& torch_error) {
        return device.SetTorchMode(TorchMode::kOn, torch_error);
      },
      CaptureErrorCode::kTorchFailed, "torch on");
  RefreshConfigurationSnapshot();
  status_.Set(CaptureStatus::kRunning);
}

void CaptureController::StopOnSessionQueue() {
  if (!session_->IsRunning()) {
    return;
  }

  (void)ConfigureCaptureDevice(
      [](ICaptureDevice& device, std::string& torch_error) {
        return device.SetTorchMode(TorchMode::kOff, torch_error);
      },
      CaptureErrorCode::kTorchFailed, "torch off");

  std::string error;
  if (!session_->StopRunning(error)) {
    logger_.Warn("capture session reported a problem while stopping", {{"error", error}});
    RecordError(CaptureErrorCode::kSessionStopFailed, error);
  }
  RefreshConfigurationSnapshot();
  status_.Set(CaptureStatus::kStopped);
}

bool CaptureController::ConfigureCaptureDevice(
    const std::function<bool(ICaptureDevice&, std::string&)>& body,
    const CaptureErrorCode failure_code, const std::string_view action) {
  if (device_ == nullptr) {
    return false;
  }

  std::string error;
  if (!device_->LockForConfiguration(error)) {
    logger_.Error("unable to obtain capture device configuration lock",
                  {{"action", action}, {"error", error}});
    RecordError(CaptureErrorCode::kConfigurationLockFailed, error);
    return false;
  }

  const bool applied = body(*device_, error);
  device_->UnlockForConfiguration();
  if (!applied) {
    logger_.Error("capture device configuration failed", {{"action", action}, {"error", error}});
    RecordError(failure_code, error);
  }
  return applied;
}

void CaptureController::RecordError(const CaptureErrorCode code, std::string detail) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  last_error_ = CaptureError{.code = code, .detail = std::move(detail)};
}

void CaptureController::RefreshConfigurationSnapshot() {
  if (device_ == nullptr) {
    return;
  }
  DeviceConfiguration snapshot = device_->ActiveConfiguration();
  std::lock_guard<std::mutex> lock(state_mutex_);
  configuration_ = std::move(snapshot);
}

void CaptureController::HandleSample(Frame&& frame) {
  // Fire-and-forget: a finished stream means nobody is listening any more.
  (void)preview_stream_.Yield(std::move(frame));
}

CaptureStatus CaptureController::Status() const {
  return status_.Get();
}

core::async::Published<CaptureStatus>& CaptureController::StatusPublisher() {
  return status_;
}

core::async::AsyncStream<Frame>& CaptureController::PreviewStream() {
  return preview_stream_;
}

double CaptureController::FrameRate() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return frame_rate_;
}

DeviceConfiguration CaptureController::Configuration() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return configuration_;
}

CaptureError CaptureController::LastError() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return last_error_;
}

bool CaptureController::HasDevice() const {
  return device_ != nullptr;
}

void CaptureController::Synchronize() {
  if (session_queue_.IsCurrent()) {
    return;
  }
  std::promise<void> drained;
  std::future<void> done = drained.get_future();
  session_queue_.Async([&drained] { drained.set_value(); });
  done.wait();
}

bool CaptureController::IsSessionRunning() {
  if (session_queue_.IsCurrent()) {
    return session_->IsRunning();
  }
  std::promise<bool> running;
  std::future<bool> result = running.get_future();
  session_queue_.Async([this, &running] { running.set_value(session_->IsRunning()); });
  return result.get();
}

} // namespace pulsecam::capture
