#pragma once

#include "capture/capture_controller.hpp"
#include "capture/capture_status.hpp"

#include <string>

namespace pulsecam::view {

enum class ControlAction {
  kNone = 0,
  kStart,
  kStop,
};

const char* ToString(ControlAction action);

// What the start/stop control shows and does for one camera status.
struct ControlState {
  std::string label;
  bool enabled = false;
  ControlAction action = ControlAction::kNone;
};

// Text shown in place of the viewfinder. Empty while running, when the latest
// preview image is shown instead.
std::string PreviewText(capture::CaptureStatus status);

ControlState ControlFor(capture::CaptureStatus status);

// Runs the control's action against `controller`. Returns false when the
// control is disabled or has no action.
bool InvokeControl(const ControlState& control, capture::CaptureController& controller);

} // namespace pulsecam::view
