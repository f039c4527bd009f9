#include "capture/capture_status.hpp"

namespace pulsecam::capture {

const char* ToString(const CaptureStatus status) {
  switch (status) {
  case CaptureStatus::kUninitialized:
    return "uninitialized";
  case CaptureStatus::kMissingDevice:
    return "missing_device";
  case CaptureStatus::kUnauthorized:
    return "unauthorized";
  case CaptureStatus::kRunning:
    return "running";
  case CaptureStatus::kStopped:
    return "stopped";
  }
  return "uninitialized";
}

const char* ToString(const CaptureErrorCode code) {
  switch (code) {
  case CaptureErrorCode::kNone:
    return "none";
  case CaptureErrorCode::kNoEligibleDevice:
    return "no_eligible_device";
  case CaptureErrorCode::kDeviceOpenFailed:
    return "device_open_failed";
  case CaptureErrorCode::kInputRejected:
    return "input_rejected";
  case CaptureErrorCode::kOutputRejected:
    return "output_rejected";
  case CaptureErrorCode::kAuthorizationDenied:
    return "authorization_denied";
  case CaptureErrorCode::kConfigurationLockFailed:
    return "configuration_lock_failed";
  case CaptureErrorCode::kFormatApplyFailed:
    return "format_apply_failed";
  case CaptureErrorCode::kTorchFailed:
    return "torch_failed";
  case CaptureErrorCode::kSessionStartFailed:
    return "session_start_failed";
  case CaptureErrorCode::kSessionStopFailed:
    return "session_stop_failed";
  }
  return "none";
}

} // namespace pulsecam::capture
