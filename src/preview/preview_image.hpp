#pragma once

#include "capture/frame.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pulsecam::preview {

// Displayable 8-bit single-channel image, row-major with no padding.
struct PreviewImage {
  std::uint64_t sequence = 0U;
  std::uint32_t width = 0U;
  std::uint32_t height = 0U;
  std::vector<std::uint8_t> luma;

  bool IsEmpty() const {
    return width == 0U || height == 0U || luma.empty();
  }

  std::uint8_t At(std::uint32_t x, std::uint32_t y) const {
    return luma[static_cast<std::size_t>(y) * width + x];
  }
};

// Whether `ConvertFrameToPreview` understands `pixel_format` in this build.
bool IsPreviewFormatSupported(std::string_view pixel_format);

// Extracts the luminance plane of `frame`.
//
// YUYV, UYVY and GREY are handled directly. MJPG/JPEG needs the OpenCV build.
// Fails on short buffers and unknown pixel formats.
bool ConvertFrameToPreview(const capture::Frame& frame, PreviewImage& image, std::string& error);

} // namespace pulsecam::preview
