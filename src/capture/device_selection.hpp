#pragma once

#include "capture/capture_device.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pulsecam::capture {

struct DeviceEligibility {
  bool eligible = false;
  // First failed requirement, empty when eligible.
  std::string reason;
};

// A device qualifies when it is connected, not suspended, not facing the
// user, and has a writable flashlight with a torch mode. Devices that do not
// report an orientation are accepted.
DeviceEligibility EvaluateDeviceEligibility(const CaptureDeviceInfo& device);

// Index of the first eligible device in enumeration order.
std::optional<std::size_t> SelectCaptureDevice(const std::vector<CaptureDeviceInfo>& devices);

} // namespace pulsecam::capture
