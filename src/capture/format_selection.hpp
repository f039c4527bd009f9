#pragma once

#include "capture/capture_format.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace pulsecam::capture {

struct CaptureFormatChoice {
  // Position of `format` in the input list.
  std::size_t index = 0U;
  CaptureFormat format;
  FrameRateRange range;
};

// Range with the highest maximum frame rate; the first one wins on ties.
// Returns nothing for a format without ranges.
std::optional<FrameRateRange> HighestFrameRateRange(const CaptureFormat& format);

// Chooses the lowest-resolution format among those reaching the highest
// frame rate any format offers. A brightness trend needs temporal, not
// spatial, resolution, and small frames keep per-frame work cheap.
//
// 1) formats without frame rate ranges are ignored
// 2) each format is represented by its highest-frame-rate range
// 3) only formats whose range reaches the global maximum stay candidates
// 4) the smallest width x height wins; enumeration order breaks exact ties
std::optional<CaptureFormatChoice> ChooseCaptureFormat(const std::vector<CaptureFormat>& formats);

} // namespace pulsecam::capture
