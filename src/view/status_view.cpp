#include "view/status_view.hpp"

namespace pulsecam::view {

const char* ToString(const ControlAction action) {
  switch (action) {
  case ControlAction::kNone:
    return "none";
  case ControlAction::kStart:
    return "start";
  case ControlAction::kStop:
    return "stop";
  }
  return "none";
}

std::string PreviewText(const capture::CaptureStatus status) {
  switch (status) {
  case capture::CaptureStatus::kUninitialized:
    return "Ready to start camera...";
  case capture::CaptureStatus::kMissingDevice:
    return "Could not find available camera/flashlight device";
  case capture::CaptureStatus::kUnauthorized:
    return "Please give app access to the camera";
  case capture::CaptureStatus::kStopped:
    return "Camera stopped";
  case capture::CaptureStatus::kRunning:
    return "";
  }
  return "";
}

ControlState ControlFor(const capture::CaptureStatus status) {
  switch (status) {
  case capture::CaptureStatus::kMissingDevice:
  case capture::CaptureStatus::kUnauthorized:
    return ControlState{.label = "Start Camera", .enabled = false, .action = ControlAction::kNone};
  case capture::CaptureStatus::kUninitialized:
  case capture::CaptureStatus::kStopped:
    return ControlState{.label = "Start Camera", .enabled = true, .action = ControlAction::kStart};
  case capture::CaptureStatus::kRunning:
    return ControlState{.label = "Stop Camera", .enabled = true, .action = ControlAction::kStop};
  }
  return ControlState{.label = "Start Camera", .enabled = false, .action = ControlAction::kNone};
}

bool InvokeControl(const ControlState& control, capture::CaptureController& controller) {
  if (!control.enabled) {
    return false;
  }
  switch (control.action) {
  case ControlAction::kStart:
    controller.Start();
    return true;
  case ControlAction::kStop:
    controller.Stop();
    return true;
  case ControlAction::kNone:
    return false;
  }
  return false;
}

} // namespace pulsecam::view
