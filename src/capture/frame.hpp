#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace pulsecam::capture {

// One captured video buffer copied out of driver memory. Owns its bytes, so
// it stays valid after the driver buffer is handed back for reuse.
struct Frame {
  std::uint64_t sequence = 0U;
  std::chrono::system_clock::time_point timestamp{};
  std::string pixel_format;
  std::uint32_t width = 0U;
  std::uint32_t height = 0U;
  std::uint32_t bytes_per_line = 0U;
  std::vector<std::uint8_t> data;
};

} // namespace pulsecam::capture
