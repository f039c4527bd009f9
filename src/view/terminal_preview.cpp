#include "view/terminal_preview.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>

namespace pulsecam::view {

FillGeometry ComputeScaleToFill(const std::uint32_t source_width,
                                const std::uint32_t source_height,
                                const std::uint32_t target_width,
                                const std::uint32_t target_height) {
  FillGeometry geometry;
  if (source_width == 0U || source_height == 0U || target_width == 0U ||
      target_height == 0U) {
    return geometry;
  }

  const double scale_x = static_cast<double>(target_width) / source_width;
  const double scale_y = static_cast<double>(target_height) / source_height;
  geometry.scale = std::max(scale_x, scale_y);
  geometry.scaled_width = std::max(
      target_width, static_cast<std::uint32_t>(std::lround(source_width * geometry.scale)));
  geometry.scaled_height = std::max(
      target_height, static_cast<std::uint32_t>(std::lround(source_height * geometry.scale)));
  geometry.crop_x = (geometry.scaled_width - target_width) / 2U;
  geometry.crop_y = (geometry.scaled_height - target_height) / 2U;
  return geometry;
}

std::vector<std::string> RenderAscii(const preview::PreviewImage& image,
                                     const std::uint32_t columns, const std::uint32_t rows) {
  std::vector<std::string> lines;
  if (image.IsEmpty() || columns == 0U || rows == 0U) {
    return lines;
  }

  // Work in square "pixel" units: one cell covers kTerminalCellAspect of them
  // vertically.
  const auto target_height =
      static_cast<std::uint32_t>(std::lround(rows * kTerminalCellAspect));
  const FillGeometry geometry =
      ComputeScaleToFill(image.width, image.height, columns, target_height);

  constexpr std::size_t kRampSize = sizeof(kAsciiRamp) - 1U;
  lines.reserve(rows);
  for (std::uint32_t row = 0U; row < rows; ++row) {
    std::string line(columns, ' ');
    const double target_y = (row + 0.5) * kTerminalCellAspect + geometry.crop_y;
    const auto source_y = std::min<std::uint32_t>(
        image.height - 1U, static_cast<std::uint32_t>(target_y / geometry.scale));
    for (std::uint32_t column = 0U; column < columns; ++column) {
      const double target_x = column + 0.5 + geometry.crop_x;
      const auto source_x = std::min<std::uint32_t>(
          image.width - 1U, static_cast<std::uint32_t>(target_x / geometry.scale));
      const std::size_t level = static_cast<std::size_t>(image.At(source_x, source_y)) *
                                kRampSize / 256U;
      line[column] = kAsciiRamp[level];
    }
    lines.push_back(std::move(line));
  }
  return lines;
}

} // namespace pulsecam::view
