#include "capture/capture_device.hpp"

namespace pulsecam::capture {

const char* ToString(const DevicePosition position) {
  switch (position) {
  case DevicePosition::kUnspecified:
    return "unspecified";
  case DevicePosition::kFront:
    return "front";
  case DevicePosition::kBack:
    return "back";
  case DevicePosition::kExternal:
    return "external";
  }
  return "unspecified";
}

const char* ToString(const TorchMode mode) {
  switch (mode) {
  case TorchMode::kOff:
    return "off";
  case TorchMode::kOn:
    return "on";
  }
  return "off";
}

} // namespace pulsecam::capture
