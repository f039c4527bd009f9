#include "capture/device_selection.hpp"

namespace pulsecam::capture {

DeviceEligibility EvaluateDeviceEligibility(const CaptureDeviceInfo& device) {
  if (!device.connected) {
    return {.eligible = false,
            .reason = device.probe_error.empty() ? "not connected"
                                                 : "not connected: " + device.probe_error};
  }
  if (device.suspended) {
    return {.eligible = false, .reason = "suspended (input reports no power)"};
  }
  if (device.position == DevicePosition::kFront || device.position == DevicePosition::kExternal) {
    return {.eligible = false,
            .reason = std::string("not back-facing (orientation=") + ToString(device.position) +
                      ")"};
  }
  if (!device.has_torch) {
    return {.eligible = false, .reason = "no flashlight control"};
  }
  if (!device.torch_available) {
    return {.eligible = false, .reason = "flashlight control is not writable"};
  }
  if (!device.torch_on_supported) {
    return {.eligible = false, .reason = "flashlight has no torch mode"};
  }
  return {.eligible = true, .reason = ""};
}

std::optional<std::size_t> SelectCaptureDevice(const std::vector<CaptureDeviceInfo>& devices) {
  for (std::size_t i = 0; i < devices.size(); ++i) {
    if (EvaluateDeviceEligibility(devices[i]).eligible) {
      return i;
    }
  }
  return std::nullopt;
}

} // namespace pulsecam::capture
