#pragma once

#include <string>

namespace pulsecam::capture {

// Observable lifecycle state of the capture controller. The enum doubles as
// the user-facing error surface: `kMissingDevice` and `kUnauthorized` are the
// only failure states a caller ever sees.
enum class CaptureStatus {
  kUninitialized = 0,
  kMissingDevice,
  kUnauthorized,
  kRunning,
  kStopped,
};

const char* ToString(CaptureStatus status);

// Cause of the most recent failure absorbed by the controller.
enum class CaptureErrorCode {
  kNone = 0,
  kNoEligibleDevice,
  kDeviceOpenFailed,
  kInputRejected,
  kOutputRejected,
  kAuthorizationDenied,
  kConfigurationLockFailed,
  kFormatApplyFailed,
  kTorchFailed,
  kSessionStartFailed,
  kSessionStopFailed,
};

const char* ToString(CaptureErrorCode code);

struct CaptureError {
  CaptureErrorCode code = CaptureErrorCode::kNone;
  std::string detail;

  bool HasError() const {
    return code != CaptureErrorCode::kNone;
  }
};

} // namespace pulsecam::capture
