#include "preview/opencv_support.hpp"

#include <string>

#if PULSECAM_ENABLE_OPENCV
#include <opencv2/core/version.hpp>
#endif

namespace pulsecam::preview {

bool IsOpenCvEnabled() {
#if PULSECAM_ENABLE_OPENCV
  return true;
#else
  return false;
#endif
}

const char* OpenCvStatusText() {
#if PULSECAM_ENABLE_OPENCV
  return "enabled";
#else
  return "disabled";
#endif
}

std::string OpenCvDetail() {
#if PULSECAM_ENABLE_OPENCV
  return std::string("MJPEG preview decoding via OpenCV ") + CV_VERSION;
#else
  return "MJPEG preview decoding not compiled (raw YUYV/UYVY/GREY only)";
#endif
}

} // namespace pulsecam::preview
