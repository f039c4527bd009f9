#include "capture/capture_session.hpp"

namespace pulsecam::capture {

CaptureSession::CaptureSession(core::logging::Logger& logger) : logger_(logger) {}

CaptureSession::~CaptureSession() {
  if (running_) {
    std::string error;
    if (!StopRunning(error)) {
      logger_.Warn("capture session stop during teardown failed", {{"error", error}});
    }
  }
}

void CaptureSession::BeginConfiguration() {
  ++configuration_depth_;
}

void CaptureSession::CommitConfiguration() {
  if (configuration_depth_ > 0) {
    --configuration_depth_;
  }
}

bool CaptureSession::IsConfiguring() const {
  return configuration_depth_ > 0;
}

bool CaptureSession::CanAddInput(const ICaptureDevice* device) const {
  return device != nullptr && input_ == nullptr && !running_ && device->Info().connected;
}

bool CaptureSession::AddInput(ICaptureDevice* device, std::string& error) {
  error.clear();
  if (!CanAddInput(device)) {
    error = "capture session cannot accept this input";
    return false;
  }
  input_ = device;
  logger_.Debug("capture session input added", {{"device", device->Info().device_path}});
  return true;
}

bool CaptureSession::HasInputs() const {
  return input_ != nullptr;
}

bool CaptureSession::CanAddOutput(const VideoDataOutput* output) const {
  return output != nullptr && output_ == nullptr && !running_;
}

bool CaptureSession::AddOutput(VideoDataOutput* output, std::string& error) {
  error.clear();
  if (!CanAddOutput(output)) {
    error = "capture session cannot accept this output";
    return false;
  }
  output_ = output;
  return true;
}

bool CaptureSession::HasOutputs() const {
  return output_ != nullptr;
}

bool CaptureSession::StartRunning(std::string& error) {
  error.clear();
  if (running_) {
    return true;
  }
  if (input_ == nullptr) {
    error = "capture session has no input";
    return false;
  }
  if (IsConfiguring()) {
    error = "capture session cannot start inside an open configuration bracket";
    return false;
  }

  if (!input_->StartStreaming(error)) {
    return false;
  }

  if (output_ != nullptr && !output_->BeginDelivery(*input_, error)) {
    std::string stop_error;
    if (!input_->StopStreaming(stop_error)) {
      error += "; stop after failed delivery start also failed: " + stop_error;
    }
    return false;
  }

  running_ = true;
  logger_.Debug("capture session running", {{"device", input_->Info().device_path}});
  return true;
}

bool CaptureSession::StopRunning(std::string& error) {
  error.clear();
  if (!running_) {
    return true;
  }

  if (output_ != nullptr) {
    output_->EndDelivery();
  }
  running_ = false;

  if (!input_->StopStreaming(error)) {
    return false;
  }
  logger_.Debug("capture session stopped", {{"device", input_->Info().device_path}});
  return true;
}

bool CaptureSession::IsRunning() const {
  return running_;
}

} // namespace pulsecam::capture
