#pragma once

namespace pulsecam::core::errors {

// Stable process-exit contract for the CLI.
//
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// Capture outcomes that the controller only reports through its status enum
// get their own values so wrappers can branch without scraping stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kMissingDevice = 20,
  kUnauthorized = 21,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace pulsecam::core::errors
