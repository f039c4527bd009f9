#include "preview/preview_image.hpp"

#include <algorithm>
#include <cstddef>

#if PULSECAM_ENABLE_OPENCV
#include <opencv2/core.hpp>
#include <opencv2/core/mat.hpp>
#include <opencv2/imgcodecs.hpp>
#endif

namespace pulsecam::preview {

namespace {

bool IsJpegFormat(std::string_view pixel_format) {
  return pixel_format == "MJPG" || pixel_format == "JPEG";
}

// Copies every `step`-th byte starting at `first` from each row.
bool ExtractLumaPlane(const capture::Frame& frame, const std::size_t bytes_per_pixel,
                      const std::size_t first, const std::size_t step, PreviewImage& image,
                      std::string& error) {
  const std::size_t packed_stride = static_cast<std::size_t>(frame.width) * bytes_per_pixel;
  const std::size_t stride =
      frame.bytes_per_line >= packed_stride ? frame.bytes_per_line : packed_stride;
  const std::size_t required = stride * (frame.height - 1U) + packed_stride;
  if (frame.data.size() < required) {
    error = frame.pixel_format + " frame " + std::to_string(frame.width) + "x" +
            std::to_string(frame.height) + " needs " + std::to_string(required) +
            " bytes, got " + std::to_string(frame.data.size());
    return false;
  }

  image.width = frame.width;
  image.height = frame.height;
  image.luma.resize(static_cast<std::size_t>(frame.width) * frame.height);
  for (std::uint32_t y = 0U; y < frame.height; ++y) {
    const std::uint8_t* row = frame.data.data() + stride * y;
    std::uint8_t* out = image.luma.data() + static_cast<std::size_t>(y) * frame.width;
    for (std::uint32_t x = 0U; x < frame.width; ++x) {
      out[x] = row[first + step * x];
    }
  }
  return true;
}

#if PULSECAM_ENABLE_OPENCV
bool DecodeJpeg(const capture::Frame& frame, PreviewImage& image, std::string& error) {
  if (frame.data.empty()) {
    error = frame.pixel_format + " frame has an empty payload";
    return false;
  }

  const cv::Mat encoded(1, static_cast<int>(frame.data.size()), CV_8UC1,
                        const_cast<std::uint8_t*>(frame.data.data()));
  cv::Mat decoded;
  try {
    decoded = cv::imdecode(encoded, cv::IMREAD_GRAYSCALE);
  } catch (const cv::Exception& ex) {
    error = "OpenCV rejected " + frame.pixel_format + " frame: " + ex.what();
    return false;
  }
  if (decoded.empty()) {
    error = "OpenCV could not decode " + frame.pixel_format + " frame of " +
            std::to_string(frame.data.size()) + " bytes";
    return false;
  }

  image.width = static_cast<std::uint32_t>(decoded.cols);
  image.height = static_cast<std::uint32_t>(decoded.rows);
  image.luma.resize(static_cast<std::size_t>(decoded.cols) * decoded.rows);
  for (int y = 0; y < decoded.rows; ++y) {
    const std::uint8_t* row = decoded.ptr<std::uint8_t>(y);
    std::copy(row, row + decoded.cols,
              image.luma.begin() + static_cast<std::ptrdiff_t>(y) * decoded.cols);
  }
  return true;
}
#endif

} // namespace

bool IsPreviewFormatSupported(std::string_view pixel_format) {
  if (pixel_format == "YUYV" || pixel_format == "UYVY" || pixel_format == "GREY") {
    return true;
  }
#if PULSECAM_ENABLE_OPENCV
  return IsJpegFormat(pixel_format);
#else
  return false;
#endif
}

bool ConvertFrameToPreview(const capture::Frame& frame, PreviewImage& image, std::string& error) {
  error.clear();
  image = PreviewImage{};
  image.sequence = frame.sequence;

  if (IsJpegFormat(frame.pixel_format)) {
#if PULSECAM_ENABLE_OPENCV
    return DecodeJpeg(frame, image, error);
#else
    error = frame.pixel_format + " preview requires a build with OpenCV";
    return false;
#endif
  }

  if (frame.width == 0U || frame.height == 0U) {
    error = "frame has no dimensions";
    return false;
  }
  if (frame.pixel_format == "YUYV") {
    return ExtractLumaPlane(frame, 2U, 0U, 2U, image, error);
  }
  if (frame.pixel_format == "UYVY") {
    return ExtractLumaPlane(frame, 2U, 1U, 2U, image, error);
  }
  if (frame.pixel_format == "GREY") {
    return ExtractLumaPlane(frame, 1U, 0U, 1U, image, error);
  }

  error = "unsupported preview pixel format: " +
          (frame.pixel_format.empty() ? std::string("<none>") : frame.pixel_format);
  return false;
}

} // namespace pulsecam::preview
