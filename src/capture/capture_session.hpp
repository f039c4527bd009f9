#pragma once

#include "capture/capture_device.hpp"
#include "capture/video_data_output.hpp"
#include "core/logging/logger.hpp"

#include <string>

namespace pulsecam::capture {

// Connects one input device to one video data output and runs them.
//
// Not thread-safe: every call must come from the same serialized context
// (the controller's session queue). The session does not own the device or
// the output.
class CaptureSession {
public:
  explicit CaptureSession(core::logging::Logger& logger);
  ~CaptureSession();

  CaptureSession(const CaptureSession&) = delete;
  CaptureSession& operator=(const CaptureSession&) = delete;

  // Configuration bracket. Brackets nest; the session cannot start while one
  // is open.
  void BeginConfiguration();
  void CommitConfiguration();
  bool IsConfiguring() const;

  bool CanAddInput(const ICaptureDevice* device) const;
  bool AddInput(ICaptureDevice* device, std::string& error);
  bool HasInputs() const;

  bool CanAddOutput(const VideoDataOutput* output) const;
  bool AddOutput(VideoDataOutput* output, std::string& error);
  bool HasOutputs() const;

  bool StartRunning(std::string& error);
  // Always leaves the session not running; returns false when the device
  // reported a problem while stopping.
  bool StopRunning(std::string& error);
  bool IsRunning() const;

private:
  core::logging::Logger& logger_;
  ICaptureDevice* input_ = nullptr;
  VideoDataOutput* output_ = nullptr;
  int configuration_depth_ = 0;
  bool running_ = false;
};

// Begin/commit pair bound to a scope.
class ScopedSessionConfiguration {
public:
  explicit ScopedSessionConfiguration(CaptureSession& session) : session_(session) {
    session_.BeginConfiguration();
  }

  ~ScopedSessionConfiguration() {
    session_.CommitConfiguration();
  }

  ScopedSessionConfiguration(const ScopedSessionConfiguration&) = delete;
  ScopedSessionConfiguration& operator=(const ScopedSessionConfiguration&) = delete;

private:
  CaptureSession& session_;
};

} // namespace pulsecam::capture
