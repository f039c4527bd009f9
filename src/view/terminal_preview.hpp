#pragma once

#include "preview/preview_image.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace pulsecam::view {

// Placement of a source image scaled to cover a target area.
//
// The image is scaled uniformly so both dimensions reach the target, then the
// overflow is cropped evenly from both sides. `crop_x`/`crop_y` are measured
// in scaled pixels.
struct FillGeometry {
  double scale = 0.0;
  std::uint32_t scaled_width = 0U;
  std::uint32_t scaled_height = 0U;
  std::uint32_t crop_x = 0U;
  std::uint32_t crop_y = 0U;
};

FillGeometry ComputeScaleToFill(std::uint32_t source_width, std::uint32_t source_height,
                                std::uint32_t target_width, std::uint32_t target_height);

// Terminal cells are roughly twice as tall as they are wide.
inline constexpr double kTerminalCellAspect = 2.0;

// Dark-to-bright character ramp.
inline constexpr char kAsciiRamp[] = " .:-=+*#%@";

// Renders `image` scale-to-fill into `rows` lines of `columns` characters.
// Returns no lines for an empty image or an empty grid.
std::vector<std::string> RenderAscii(const preview::PreviewImage& image, std::uint32_t columns,
                                     std::uint32_t rows);

} // namespace pulsecam::view
