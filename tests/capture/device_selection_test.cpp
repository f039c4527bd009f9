#include "capture/device_selection.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

namespace {

using pulsecam::capture::CaptureDeviceInfo;
using pulsecam::capture::DevicePosition;

CaptureDeviceInfo EligibleDevice(std::string path) {
  CaptureDeviceInfo info;
  info.device_path = std::move(path);
  info.position = DevicePosition::kBack;
  info.connected = true;
  info.has_torch = true;
  info.torch_available = true;
  info.torch_on_supported = true;
  return info;
}

} // namespace

TEST_CASE("A connected back camera with a torch is eligible", "[capture][device_selection]") {
  const auto verdict = pulsecam::capture::EvaluateDeviceEligibility(EligibleDevice("/dev/video0"));
  REQUIRE(verdict.eligible);
  REQUIRE(verdict.reason.empty());
}

TEST_CASE("Devices without an orientation are accepted", "[capture][device_selection]") {
  CaptureDeviceInfo info = EligibleDevice("/dev/video0");
  info.position = DevicePosition::kUnspecified;
  REQUIRE(pulsecam::capture::EvaluateDeviceEligibility(info).eligible);
}

TEST_CASE("Ineligible devices carry a reason", "[capture][device_selection]") {
  CaptureDeviceInfo disconnected = EligibleDevice("/dev/video0");
  disconnected.connected = false;
  disconnected.probe_error = "permission denied";
  auto verdict = pulsecam::capture::EvaluateDeviceEligibility(disconnected);
  REQUIRE_FALSE(verdict.eligible);
  REQUIRE(verdict.reason == "not connected: permission denied");

  CaptureDeviceInfo suspended = EligibleDevice("/dev/video0");
  suspended.suspended = true;
  REQUIRE_FALSE(pulsecam::capture::EvaluateDeviceEligibility(suspended).eligible);

  CaptureDeviceInfo front = EligibleDevice("/dev/video0");
  front.position = DevicePosition::kFront;
  verdict = pulsecam::capture::EvaluateDeviceEligibility(front);
  REQUIRE_FALSE(verdict.eligible);
  REQUIRE(verdict.reason == "not back-facing (orientation=front)");

  CaptureDeviceInfo no_torch = EligibleDevice("/dev/video0");
  no_torch.has_torch = false;
  REQUIRE(pulsecam::capture::EvaluateDeviceEligibility(no_torch).reason ==
          "no flashlight control");

  CaptureDeviceInfo busy_torch = EligibleDevice("/dev/video0");
  busy_torch.torch_available = false;
  REQUIRE(pulsecam::capture::EvaluateDeviceEligibility(busy_torch).reason ==
          "flashlight control is not writable");

  CaptureDeviceInfo flash_only = EligibleDevice("/dev/video0");
  flash_only.torch_on_supported = false;
  REQUIRE(pulsecam::capture::EvaluateDeviceEligibility(flash_only).reason ==
          "flashlight has no torch mode");
}

TEST_CASE("Selection takes the first eligible device in enumeration order",
          "[capture][device_selection]") {
  std::vector<CaptureDeviceInfo> devices = {EligibleDevice("/dev/video0"),
                                            EligibleDevice("/dev/video2"),
                                            EligibleDevice("/dev/video4")};
  devices[0].has_torch = false;

  const auto selected = pulsecam::capture::SelectCaptureDevice(devices);
  REQUIRE(selected.has_value());
  REQUIRE(selected.value() == 1U);

  devices[1].connected = false;
  devices[2].position = DevicePosition::kExternal;
  REQUIRE_FALSE(pulsecam::capture::SelectCaptureDevice(devices).has_value());
  REQUIRE_FALSE(pulsecam::capture::SelectCaptureDevice({}).has_value());
}
