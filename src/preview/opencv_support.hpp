#pragma once

#include <string>

namespace pulsecam::preview {

// Reports whether MJPEG preview decoding through OpenCV was compiled into the
// current binary.
bool IsOpenCvEnabled();

// Short machine-friendly status string: `enabled` or `disabled`.
const char* OpenCvStatusText();

// Human-readable detail for `pulsecam version`.
std::string OpenCvDetail();

} // namespace pulsecam::preview
