#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pulsecam::capture {

// Time between frames as a fraction of a second (`numerator / denominator`),
// the same shape V4L2 uses for `timeperframe`.
struct FrameDuration {
  std::uint32_t numerator = 0U;
  std::uint32_t denominator = 0U;

  bool IsValid() const {
    return numerator != 0U && denominator != 0U;
  }

  double Seconds() const;

  // Frames per second implied by this duration; 0 for an invalid duration.
  double FrameRate() const;
};

bool operator==(const FrameDuration& left, const FrameDuration& right);

struct FrameRateRange {
  // Shortest frame duration, i.e. the maximum frame rate.
  FrameDuration min_frame_duration;
  // Longest frame duration, i.e. the minimum frame rate.
  FrameDuration max_frame_duration;

  double MaxFrameRate() const {
    return min_frame_duration.FrameRate();
  }

  double MinFrameRate() const {
    return max_frame_duration.FrameRate();
  }
};

// One device-supported resolution for a pixel format and the frame rate
// ranges available at that resolution.
struct CaptureFormat {
  std::string pixel_format;
  std::uint32_t width = 0U;
  std::uint32_t height = 0U;
  std::vector<FrameRateRange> frame_rate_ranges;

  std::uint64_t PixelCount() const {
    return static_cast<std::uint64_t>(width) * static_cast<std::uint64_t>(height);
  }
};

// Human-readable summary, for example `YUYV 640x480 @ 5-60 fps`.
std::string Describe(const CaptureFormat& format);

std::string FourccToString(std::uint32_t fourcc);
std::optional<std::uint32_t> ParseFourcc(std::string_view text);

} // namespace pulsecam::capture
