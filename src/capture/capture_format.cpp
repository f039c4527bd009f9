#include "capture/capture_format.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace pulsecam::capture {

namespace {

std::string FormatCompactDouble(const double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << value;
  std::string text = out.str();
  while (!text.empty() && text.back() == '0') {
    text.pop_back();
  }
  if (!text.empty() && text.back() == '.') {
    text.pop_back();
  }
  return text.empty() ? "0" : text;
}

} // namespace

double FrameDuration::Seconds() const {
  if (denominator == 0U) {
    return 0.0;
  }
  return static_cast<double>(numerator) / static_cast<double>(denominator);
}

double FrameDuration::FrameRate() const {
  if (!IsValid()) {
    return 0.0;
  }
  return static_cast<double>(denominator) / static_cast<double>(numerator);
}

bool operator==(const FrameDuration& left, const FrameDuration& right) {
  return left.numerator == right.numerator && left.denominator == right.denominator;
}

std::string Describe(const CaptureFormat& format) {
  std::ostringstream out;
  out << format.pixel_format << ' ' << format.width << 'x' << format.height;
  if (format.frame_rate_ranges.empty()) {
    out << " @ no frame rates";
    return out.str();
  }

  double lowest = format.frame_rate_ranges.front().MinFrameRate();
  double highest = format.frame_rate_ranges.front().MaxFrameRate();
  for (const FrameRateRange& range : format.frame_rate_ranges) {
    lowest = std::min(lowest, range.MinFrameRate());
    highest = std::max(highest, range.MaxFrameRate());
  }

  out << " @ ";
  if (lowest == highest) {
    out << FormatCompactDouble(highest);
  } else {
    out << FormatCompactDouble(lowest) << '-' << FormatCompactDouble(highest);
  }
  out << " fps";
  return out.str();
}

std::string FourccToString(const std::uint32_t fourcc) {
  std::string text(4, ' ');
  text[0] = static_cast<char>(fourcc & 0xFFU);
  text[1] = static_cast<char>((fourcc >> 8U) & 0xFFU);
  text[2] = static_cast<char>((fourcc >> 16U) & 0xFFU);
  text[3] = static_cast<char>((fourcc >> 24U) & 0xFFU);

  const bool printable = std::all_of(text.begin(), text.end(), [](const char c) {
    const unsigned char ascii = static_cast<unsigned char>(c);
    return ascii >= 32U && ascii <= 126U;
  });
  if (printable) {
    while (!text.empty() && text.back() == ' ') {
      text.pop_back();
    }
    if (!text.empty()) {
      return text;
    }
  }

  std::ostringstream out;
  out << "0x" << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << fourcc;
  return out.str();
}

std::optional<std::uint32_t> ParseFourcc(std::string_view text) {
  if (text.empty() || text.size() > 4U) {
    return std::nullopt;
  }
  char padded[4] = {' ', ' ', ' ', ' '};
  for (std::size_t i = 0; i < text.size(); ++i) {
    padded[i] = text[i];
  }
  return static_cast<std::uint32_t>(static_cast<unsigned char>(padded[0])) |
         (static_cast<std::uint32_t>(static_cast<unsigned char>(padded[1])) << 8U) |
         (static_cast<std::uint32_t>(static_cast<unsigned char>(padded[2])) << 16U) |
         (static_cast<std::uint32_t>(static_cast<unsigned char>(padded[3])) << 24U);
}

} // namespace pulsecam::capture
