#include "capture/format_selection.hpp"

namespace pulsecam::capture {

std::optional<FrameRateRange> HighestFrameRateRange(const CaptureFormat& format) {
  std::optional<FrameRateRange> best;
  for (const FrameRateRange& range : format.frame_rate_ranges) {
    if (!best.has_value() || range.MaxFrameRate() > best->MaxFrameRate()) {
      best = range;
    }
  }
  return best;
}

std::optional<CaptureFormatChoice> ChooseCaptureFormat(const std::vector<CaptureFormat>& formats) {
  struct Candidate {
    std::size_t index = 0U;
    FrameRateRange range;
  };

  std::vector<Candidate> candidates;
  candidates.reserve(formats.size());
  for (std::size_t i = 0; i < formats.size(); ++i) {
    if (const std::optional<FrameRateRange> range = HighestFrameRateRange(formats[i]);
        range.has_value()) {
      candidates.push_back({.index = i, .range = range.value()});
    }
  }
  if (candidates.empty()) {
    return std::nullopt;
  }

  double max_frame_rate = candidates.front().range.MaxFrameRate();
  for (const Candidate& candidate : candidates) {
    if (candidate.range.MaxFrameRate() > max_frame_rate) {
      max_frame_rate = candidate.range.MaxFrameRate();
    }
  }

  const Candidate* chosen = nullptr;
  for (const Candidate& candidate : candidates) {
    if (candidate.range.MaxFrameRate() != max_frame_rate) {
      continue;
    }
    // Strict comparison keeps the first format on equal pixel counts.
    if (chosen == nullptr ||
        formats[candidate.index].PixelCount() < formats[chosen->index].PixelCount()) {
      chosen = &candidate;
    }
  }

  return CaptureFormatChoice{
      .index = chosen->index,
      .format = formats[chosen->index],
      .range = chosen->range,
  };
}

} // namespace pulsecam::capture
