#pragma once

#include "capture/authorization.hpp"
#include "capture/capture_device.hpp"
#include "capture/capture_session.hpp"
#include "capture/capture_status.hpp"
#include "capture/format_selection.hpp"
#include "capture/frame.hpp"
#include "capture/video_data_output.hpp"
#include "core/async/async_stream.hpp"
#include "core/async/published.hpp"
#include "core/dispatch/serial_queue.hpp"
#include "core/logging/logger.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace pulsecam::capture {

struct CaptureControllerOptions {
  core::async::BufferingPolicy frame_buffering = core::async::BufferingPolicy::Unbounded();
  // Upper bound for one frame wait on the delivery thread; bounds how long a
  // stop waits for the delivery thread to notice.
  std::chrono::milliseconds frame_wait_timeout{200};
};

// Owns one camera-plus-flashlight device and its capture session.
//
// Lifecycle:
// - construction selects and opens the first eligible device, then queues the
//   session configuration; every failure is absorbed and leaves the
//   controller without an input
// - `Start`/`Stop` never report errors; the outcome is observable through
//   `Status()` and, for the cause, `LastError()`
// - all session and status mutations run on one serialized session queue, so
//   concurrent `Start`/`Stop` calls take effect one after another in arrival
//   order
//
// Frames are pushed into `PreviewStream()` from the delivery thread. The
// stream has a single consumer.
class CaptureController {
public:
  CaptureController(ICaptureDeviceProvider& provider, IAuthorizationProvider& authorization,
                    core::logging::Logger& logger, CaptureControllerOptions options = {});
  ~CaptureController();

  CaptureController(const CaptureController&) = delete;
  CaptureController& operator=(const CaptureController&) = delete;

  // Block until the session-queue work has finished (or authorization failed).
  void Start();
  void Stop();

  // Same as `Start`/`Stop`, run on a separate task.
  std::future<void> StartAsync();
  std::future<void> StopAsync();

  CaptureStatus Status() const;
  core::async::Published<CaptureStatus>& StatusPublisher();

  core::async::AsyncStream<Frame>& PreviewStream();

  // Maximum frame rate of the applied format; 60 until a format is applied.
  double FrameRate() const;
  DeviceConfiguration Configuration() const;
  CaptureError LastError() const;

  bool HasDevice() const;

  // Waits for all session-queue work queued so far.
  void Synchronize();
  // Whether the session runs, read on the session queue.
  bool IsSessionRunning();

private:
  bool CheckAuthorization();
  void ConfigureSession();
  bool ApplyCaptureFormat(ICaptureDevice& device, const CaptureFormatChoice& choice,
                          std::string& error);
  void StartOnSessionQueue();
  void StopOnSessionQueue();
  bool ConfigureCaptureDevice(const std::function<bool(ICaptureDevice&, std::string&)>& body,
                              CaptureErrorCode failure_code, std::string_view action);
  void RecordError(CaptureErrorCode code, std::string detail);
  void RefreshConfigurationSnapshot();
  void HandleSample(Frame&& frame);

  core::logging::Logger& logger_;
  IAuthorizationProvider& authorization_;
  const CaptureControllerOptions options_;

  core::async::Published<CaptureStatus> status_{CaptureStatus::kUninitialized};
  core::async::AsyncStream<Frame> preview_stream_;

  mutable std::mutex state_mutex_;
  CaptureError last_error_;
  DeviceConfiguration configuration_;
  double frame_rate_ = 60.0;

  std::unique_ptr<ICaptureDevice> device_;
  std::unique_ptr<VideoDataOutput> output_;
  std::unique_ptr<CaptureSession> session_;

  // Declared last: destroyed first, so queued work finishes while everything
  // it touches is still alive.
  core::dispatch::SerialQueue session_queue_{"capture session queue"};
};

} // namespace pulsecam::capture
