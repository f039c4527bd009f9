#include "capture/capture_format.hpp"

#include <catch2/catch.hpp>

using pulsecam::capture::CaptureFormat;
using pulsecam::capture::FrameDuration;
using pulsecam::capture::FrameRateRange;

TEST_CASE("FrameDuration converts to frame rate", "[capture][format]") {
  const FrameDuration ntsc{.numerator = 1001U, .denominator = 30000U};
  REQUIRE(ntsc.IsValid());
  REQUIRE(ntsc.FrameRate() > 29.97);
  REQUIRE(ntsc.FrameRate() < 29.98);

  const FrameDuration invalid{};
  REQUIRE_FALSE(invalid.IsValid());
  REQUIRE(invalid.FrameRate() == 0.0);
}

TEST_CASE("Describe summarizes pixel format, size and frame rates", "[capture][format]") {
  CaptureFormat format;
  format.pixel_format = "YUYV";
  format.width = 640;
  format.height = 480;
  REQUIRE(pulsecam::capture::Describe(format) == "YUYV 640x480 @ no frame rates");

  format.frame_rate_ranges.push_back(
      FrameRateRange{.min_frame_duration = {.numerator = 1U, .denominator = 60U},
                     .max_frame_duration = {.numerator = 1U, .denominator = 5U}});
  REQUIRE(pulsecam::capture::Describe(format) == "YUYV 640x480 @ 5-60 fps");

  format.frame_rate_ranges = {
      FrameRateRange{.min_frame_duration = {.numerator = 1U, .denominator = 30U},
                     .max_frame_duration = {.numerator = 1U, .denominator = 30U}}};
  REQUIRE(pulsecam::capture::Describe(format) == "YUYV 640x480 @ 30 fps");
}

TEST_CASE("FourCC codes convert to and from text", "[capture][format]") {
  const auto yuyv = pulsecam::capture::ParseFourcc("YUYV");
  REQUIRE(yuyv.has_value());
  REQUIRE(pulsecam::capture::FourccToString(yuyv.value()) == "YUYV");

  const auto grey = pulsecam::capture::ParseFourcc("Y8");
  REQUIRE(grey.has_value());
  REQUIRE(pulsecam::capture::FourccToString(grey.value()) == "Y8");

  REQUIRE_FALSE(pulsecam::capture::ParseFourcc("").has_value());
  REQUIRE_FALSE(pulsecam::capture::ParseFourcc("TOOLONG").has_value());
  REQUIRE(pulsecam::capture::FourccToString(0x01020304U) == "0x01020304");
}
