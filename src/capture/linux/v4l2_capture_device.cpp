#include "capture/linux/v4l2_capture_device.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <utility>

#include <fcntl.h>
#include <linux/videodev2.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <unistd.h>

namespace pulsecam::capture::linux_v4l2 {

namespace {

std::string Trim(std::string_view input) {
  std::size_t begin = 0U;
  while (begin < input.size() && std::isspace(static_cast<unsigned char>(input[begin])) != 0) {
    ++begin;
  }

  std::size_t end = input.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(input[end - 1U])) != 0) {
    --end;
  }
  return std::string(input.substr(begin, end - begin));
}

std::string FormatCapabilitiesHex(const std::uint32_t caps) {
  std::ostringstream out;
  out << "0x" << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << caps;
  return out.str();
}

std::string ErrnoText(const int saved_errno) {
  return std::strerror(saved_errno);
}

bool IsValidFraction(const v4l2_fract& fraction) {
  return fraction.numerator != 0U && fraction.denominator != 0U;
}

FrameDuration ToFrameDuration(const v4l2_fract& fraction) {
  return FrameDuration{.numerator = fraction.numerator, .denominator = fraction.denominator};
}

} // namespace

V4l2CaptureDevice::IoOps V4l2CaptureDevice::DefaultIoOps() {
  IoOps ops;
  ops.open_fn = [](const char* path, const int flags) { return ::open(path, flags); };
  ops.close_fn = [](const int fd) { return ::close(fd); };
  ops.ioctl_fn = [](const int fd, const unsigned long request, void* arg) {
    return ::ioctl(fd, request, arg);
  };
  ops.mmap_fn = [](void* addr, const std::size_t length, const int prot, const int flags,
                   const int fd, const std::int64_t offset) {
    return ::mmap(addr, length, prot, flags, fd, static_cast<off_t>(offset));
  };
  ops.munmap_fn = [](void* addr, const std::size_t length) { return ::munmap(addr, length); };
  ops.poll_fn = [](const int fd, const int timeout_ms) {
    pollfd descriptor{};
    descriptor.fd = fd;
    descriptor.events = POLLIN;
    return ::poll(&descriptor, 1, timeout_ms);
  };
  return ops;
}

V4l2CaptureDevice::V4l2CaptureDevice(IoOps io_ops) : io_ops_(std::move(io_ops)) {}

V4l2CaptureDevice::~V4l2CaptureDevice() {
  std::string ignored_error;
  (void)Close(ignored_error);
}

bool V4l2CaptureDevice::Open(const std::string& device_path, std::string& error) {
  bool not_capture_device = false;
  return OpenInternal(device_path, not_capture_device, error);
}

V4l2ProbeResult V4l2CaptureDevice::Probe(const std::string& device_path, const IoOps& io_ops,
                                         CaptureDeviceInfo& info, std::string& error) {
  V4l2CaptureDevice device(io_ops);
  bool not_capture_device = false;
  if (!device.OpenInternal(device_path, not_capture_device, error)) {
    info = CaptureDeviceInfo{};
    info.device_path = device_path;
    info.name = std::filesystem::path(device_path).filename().string();
    info.connected = false;
    info.probe_error = error;
    return not_capture_device ? V4l2ProbeResult::kNotCaptureDevice
                              : V4l2ProbeResult::kUnavailable;
  }

  info = device.Info();
  std::string close_error;
  if (!device.Close(close_error)) {
    error = close_error;
  }
  return V4l2ProbeResult::kCaptureDevice;
}

bool V4l2CaptureDevice::OpenInternal(const std::string& device_path, bool& not_capture_device,
                                     std::string& error) {
  error.clear();
  not_capture_device = false;

  if (device_path.empty()) {
    error = "device path cannot be empty";
    return false;
  }
  if (IsOpen()) {
    error = "device is already open: " + info_.device_path;
    return false;
  }
  if (!io_ops_.open_fn || !io_ops_.close_fn || !io_ops_.ioctl_fn) {
    error = "V4L2 IO operations are not configured";
    return false;
  }

  constexpr int kOpenFlags = O_RDWR | O_NONBLOCK;
  const int opened_fd = io_ops_.open_fn(device_path.c_str(), kOpenFlags);
  if (opened_fd < 0) {
    error = "failed to open V4L2 device '" + device_path + "': " + ErrnoText(errno);
    return false;
  }

  v4l2_capability capability{};
  if (IoctlRetry(opened_fd, VIDIOC_QUERYCAP, &capability) != 0) {
    const int saved_errno = errno;
    (void)io_ops_.close_fn(opened_fd);
    error = "VIDIOC_QUERYCAP failed for '" + device_path + "': " + ErrnoText(saved_errno);
    return false;
  }

  const std::uint32_t effective_caps =
      (capability.device_caps != 0U) ? capability.device_caps : capability.capabilities;
  if ((effective_caps & V4L2_CAP_VIDEO_CAPTURE) == 0U) {
    (void)io_ops_.close_fn(opened_fd);
    not_capture_device = true;
    error = "device '" + device_path +
            "' does not support single-planar video capture (capabilities=" +
            FormatCapabilitiesHex(effective_caps) + ")";
    return false;
  }
  if ((effective_caps & V4L2_CAP_STREAMING) == 0U) {
    (void)io_ops_.close_fn(opened_fd);
    not_capture_device = true;
    error = "device '" + device_path + "' does not support mmap streaming (capabilities=" +
            FormatCapabilitiesHex(effective_caps) + ")";
    return false;
  }

  fd_ = opened_fd;
  info_ = CaptureDeviceInfo{};
  info_.device_path = device_path;
  info_.name = Trim(reinterpret_cast<const char*>(capability.card));
  if (info_.name.empty()) {
    info_.name = std::filesystem::path(device_path).filename().string();
  }
  info_.driver = Trim(reinterpret_cast<const char*>(capability.driver));
  info_.bus_info = Trim(reinterpret_cast<const char*>(capability.bus_info));
  info_.connected = true;

  QueryInputPower();
  QueryOrientation();
  QueryTorchControl();
  QueryZoomControl();
  ReadCurrentFormat();
  ReadCurrentFrameDuration();
  return true;
}

bool V4l2CaptureDevice::Close(std::string& error) {
  error.clear();
  if (!IsOpen()) {
    return true;
  }

  std::string stop_error;
  if (streaming_ && !StopStreaming(stop_error)) {
    error = stop_error;
  }
  UnlockForConfiguration();

  if (!io_ops_.close_fn) {
    error = "V4L2 close operation is not configured";
    return false;
  }
  if (io_ops_.close_fn(fd_) != 0) {
    const std::string close_error =
        "failed to close V4L2 device '" + info_.device_path + "': " + ErrnoText(errno);
    error = error.empty() ? close_error : error + "; " + close_error;
    return false;
  }

  fd_ = -1;
  active_format_.reset();
  bytes_per_line_ = 0U;
  active_frame_duration_ = FrameDuration{};
  zoom_range_.reset();
  zoom_.reset();
  torch_mode_ = TorchMode::kOff;
  return error.empty();
}

bool V4l2CaptureDevice::IsOpen() const {
  return fd_ >= 0;
}

const CaptureDeviceInfo& V4l2CaptureDevice::Info() const {
  return info_;
}

void V4l2CaptureDevice::SetRequestedBufferCount(const std::uint32_t count) {
  requested_buffer_count_ = count == 0U ? 1U : count;
}

void V4l2CaptureDevice::QueryInputPower() {
  int input_index = 0;
  if (IoctlRetry(fd_, VIDIOC_G_INPUT, &input_index) != 0) {
    return;
  }
  v4l2_input input{};
  input.index = static_cast<std::uint32_t>(input_index);
  if (IoctlRetry(fd_, VIDIOC_ENUMINPUT, &input) != 0) {
    return;
  }
  info_.suspended = (input.status & V4L2_IN_ST_NO_POWER) != 0U;
}

void V4l2CaptureDevice::QueryOrientation() {
#if defined(V4L2_CID_CAMERA_ORIENTATION)
  v4l2_control control{};
  control.id = V4L2_CID_CAMERA_ORIENTATION;
  if (IoctlRetry(fd_, VIDIOC_G_CTRL, &control) != 0) {
    return;
  }
  switch (control.value) {
  case V4L2_CAMERA_ORIENTATION_FRONT:
    info_.position = DevicePosition::kFront;
    break;
  case V4L2_CAMERA_ORIENTATION_BACK:
    info_.position = DevicePosition::kBack;
    break;
  case V4L2_CAMERA_ORIENTATION_EXTERNAL:
    info_.position = DevicePosition::kExternal;
    break;
  default:
    info_.position = DevicePosition::kUnspecified;
    break;
  }
#endif
}

void V4l2CaptureDevice::QueryTorchControl() {
  v4l2_queryctrl query{};
  query.id = V4L2_CID_FLASH_LED_MODE;
  if (IoctlRetry(fd_, VIDIOC_QUERYCTRL, &query) != 0) {
    return;
  }
  if ((query.flags & V4L2_CTRL_FLAG_DISABLED) != 0U) {
    return;
  }

  info_.has_torch = true;
  info_.torch_available =
      (query.flags & (V4L2_CTRL_FLAG_READ_ONLY | V4L2_CTRL_FLAG_INACTIVE)) == 0U;

  const std::int32_t torch_value = V4L2_FLASH_LED_MODE_TORCH;
  if (torch_value >= query.minimum && torch_value <= query.maximum) {
    v4l2_querymenu menu{};
    menu.id = V4L2_CID_FLASH_LED_MODE;
    menu.index = static_cast<std::uint32_t>(torch_value);
    info_.torch_on_supported = IoctlRetry(fd_, VIDIOC_QUERYMENU, &menu) == 0;
  }

  v4l2_control current{};
  current.id = V4L2_CID_FLASH_LED_MODE;
  if (IoctlRetry(fd_, VIDIOC_G_CTRL, &current) == 0) {
    torch_mode_ = current.value == V4L2_FLASH_LED_MODE_TORCH ? TorchMode::kOn : TorchMode::kOff;
  }
}

void V4l2CaptureDevice::QueryZoomControl() {
  v4l2_queryctrl query{};
  query.id = V4L2_CID_ZOOM_ABSOLUTE;
  if (IoctlRetry(fd_, VIDIOC_QUERYCTRL, &query) != 0) {
    return;
  }
  if ((query.flags & (V4L2_CTRL_FLAG_DISABLED | V4L2_CTRL_FLAG_READ_ONLY)) != 0U) {
    return;
  }
  zoom_range_ = ControlRange{.minimum = query.minimum, .maximum = query.maximum};

  v4l2_control current{};
  current.id = V4L2_CID_ZOOM_ABSOLUTE;
  if (IoctlRetry(fd_, VIDIOC_G_CTRL, &current) == 0) {
    zoom_ = current.value;
  }
}

void V4l2CaptureDevice::ReadCurrentFormat() {
  v4l2_format format{};
  format.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  if (IoctlRetry(fd_, VIDIOC_G_FMT, &format) != 0) {
    return;
  }
  CaptureFormat current;
  current.pixel_format = FourccToString(format.fmt.pix.pixelformat);
  current.width = format.fmt.pix.width;
  current.height = format.fmt.pix.height;
  active_format_ = std::move(current);
  bytes_per_line_ = format.fmt.pix.bytesperline;
}

void V4l2CaptureDevice::ReadCurrentFrameDuration() {
  v4l2_streamparm stream_param{};
  stream_param.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  if (IoctlRetry(fd_, VIDIOC_G_PARM, &stream_param) != 0) {
    return;
  }
  if (IsValidFraction(stream_param.parm.capture.timeperframe)) {
    active_frame_duration_ = ToFrameDuration(stream_param.parm.capture.timeperframe);
  }
}

bool V4l2CaptureDevice::EnumerateFormats(std::vector<CaptureFormat>& formats,
                                         std::string& error) {
  error.clear();
  formats.clear();
  if (!IsOpen()) {
    error = "device must be open before enumerating formats";
    return false;
  }

  v4l2_fmtdesc format_desc{};
  format_desc.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  for (std::uint32_t format_index = 0U;; ++format_index) {
    format_desc.index = format_index;
    if (IoctlRetry(fd_, VIDIOC_ENUM_FMT, &format_desc) != 0) {
      if (format_index == 0U && errno != EINVAL) {
        error = "VIDIOC_ENUM_FMT failed for '" + info_.device_path + "': " + ErrnoText(errno);
        return false;
      }
      break;
    }

    const std::uint32_t pixel_format = format_desc.pixelformat;
    v4l2_frmsizeenum frame_size{};
    frame_size.pixel_format = pixel_format;
    for (std::uint32_t size_index = 0U;; ++size_index) {
      frame_size.index = size_index;
      if (IoctlRetry(fd_, VIDIOC_ENUM_FRAMESIZES, &frame_size) != 0) {
        break;
      }

      if (frame_size.type == V4L2_FRMSIZE_TYPE_DISCRETE) {
        CaptureFormat format;
        format.pixel_format = FourccToString(pixel_format);
        format.width = frame_size.discrete.width;
        format.height = frame_size.discrete.height;
        EnumerateFrameRateRanges(pixel_format, format.width, format.height,
                                 format.frame_rate_ranges);
        formats.push_back(std::move(format));
        continue;
      }

      // Stepwise sizes describe a whole grid; the two corner sizes are
      // enough for picking the smallest and the fastest.
      const auto& stepwise = frame_size.stepwise;
      CaptureFormat smallest;
      smallest.pixel_format = FourccToString(pixel_format);
      smallest.width = stepwise.min_width;
      smallest.height = stepwise.min_height;
      EnumerateFrameRateRanges(pixel_format, smallest.width, smallest.height,
                               smallest.frame_rate_ranges);
      formats.push_back(std::move(smallest));

      if (stepwise.max_width != stepwise.min_width ||
          stepwise.max_height != stepwise.min_height) {
        CaptureFormat largest;
        largest.pixel_format = FourccToString(pixel_format);
        largest.width = stepwise.max_width;
        largest.height = stepwise.max_height;
        EnumerateFrameRateRanges(pixel_format, largest.width, largest.height,
                                 largest.frame_rate_ranges);
        formats.push_back(std::move(largest));
      }
      break;
    }
  }
  return true;
}

void V4l2CaptureDevice::EnumerateFrameRateRanges(const std::uint32_t pixel_format,
                                                 const std::uint32_t width,
                                                 const std::uint32_t height,
                                                 std::vector<FrameRateRange>& ranges) {
  v4l2_frmivalenum interval{};
  interval.pixel_format = pixel_format;
  interval.width = width;
  interval.height = height;

  for (std::uint32_t index = 0U;; ++index) {
    interval.index = index;
    if (IoctlRetry(fd_, VIDIOC_ENUM_FRAMEINTERVALS, &interval) != 0) {
      break;
    }

    if (interval.type == V4L2_FRMIVAL_TYPE_DISCRETE) {
      if (IsValidFraction(interval.discrete)) {
        const FrameDuration duration = ToFrameDuration(interval.discrete);
        ranges.push_back({.min_frame_duration = duration, .max_frame_duration = duration});
      }
      continue;
    }

    // Stepwise/continuous: min interval => max frame rate.
    if (IsValidFraction(interval.stepwise.min) && IsValidFraction(interval.stepwise.max)) {
      ranges.push_back({.min_frame_duration = ToFrameDuration(interval.stepwise.min),
                        .max_frame_duration = ToFrameDuration(interval.stepwise.max)});
    }
    break;
  }
}

bool V4l2CaptureDevice::LockForConfiguration(std::string& error) {
  error.clear();
  if (!IsOpen()) {
    error = "device must be open before locking for configuration";
    return false;
  }
  if (locked_) {
    error = "configuration lock is already held for '" + info_.device_path + "'";
    return false;
  }

  std::uint32_t priority = V4L2_PRIORITY_RECORD;
  if (IoctlRetry(fd_, VIDIOC_S_PRIORITY, &priority) != 0) {
    const int saved_errno = errno;
    if (saved_errno != ENOTTY && saved_errno != EINVAL) {
      error = saved_errno == EBUSY
                  ? "another handle holds configuration priority on '" + info_.device_path + "'"
                  : "VIDIOC_S_PRIORITY failed for '" + info_.device_path +
                        "': " + ErrnoText(saved_errno);
      return false;
    }
    priority_raised_ = false;
  } else {
    priority_raised_ = true;
  }

  locked_ = true;
  return true;
}

void V4l2CaptureDevice::UnlockForConfiguration() {
  if (!locked_) {
    return;
  }
  if (priority_raised_ && IsOpen()) {
    std::uint32_t priority = V4L2_PRIORITY_DEFAULT;
    // Dropping priority can only fail if the handle is gone.
    (void)IoctlRetry(fd_, VIDIOC_S_PRIORITY, &priority);
  }
  priority_raised_ = false;
  locked_ = false;
}

bool V4l2CaptureDevice::IsLockedForConfiguration() const {
  return locked_;
}

bool V4l2CaptureDevice::RequireConfigurable(const char* action, std::string& error) const {
  if (!IsOpen()) {
    error = std::string("device must be open to ") + action;
    return false;
  }
  if (!locked_) {
    error = std::string("configuration lock required to ") + action;
    return false;
  }
  return true;
}

bool V4l2CaptureDevice::SetActiveFormat(const CaptureFormat& format, std::string& error) {
  error.clear();
  if (!RequireConfigurable("set the active format", error)) {
    return false;
  }
  if (streaming_) {
    error = "cannot change format of '" + info_.device_path + "' while streaming";
    return false;
  }
  const std::optional<std::uint32_t> fourcc = ParseFourcc(format.pixel_format);
  if (!fourcc.has_value()) {
    error = "pixel format must be 1-4 ASCII characters (example: YUYV)";
    return false;
  }

  v4l2_format requested{};
  requested.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  requested.fmt.pix.width = format.width;
  requested.fmt.pix.height = format.height;
  requested.fmt.pix.pixelformat = fourcc.value();
  requested.fmt.pix.field = V4L2_FIELD_ANY;
  if (IoctlRetry(fd_, VIDIOC_S_FMT, &requested) != 0) {
    error = "VIDIOC_S_FMT rejected " + Describe(format) + ": " + ErrnoText(errno);
    return false;
  }

  // The driver writes back what it actually applied, which may be the
  // nearest supported size.
  CaptureFormat applied;
  applied.pixel_format = FourccToString(requested.fmt.pix.pixelformat);
  applied.width = requested.fmt.pix.width;
  applied.height = requested.fmt.pix.height;
  applied.frame_rate_ranges = format.frame_rate_ranges;
  active_format_ = std::move(applied);
  bytes_per_line_ = requested.fmt.pix.bytesperline;
  return true;
}

bool V4l2CaptureDevice::SetFrameDurations(const FrameDuration min_duration,
                                          const FrameDuration max_duration,
                                          std::string& error) {
  error.clear();
  if (!RequireConfigurable("set frame durations", error)) {
    return false;
  }
  if (!min_duration.IsValid() || !max_duration.IsValid()) {
    error = "frame durations must have non-zero numerator and denominator";
    return false;
  }

  v4l2_streamparm stream_param{};
  stream_param.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  if (IoctlRetry(fd_, VIDIOC_G_PARM, &stream_param) != 0) {
    error = "VIDIOC_G_PARM failed: " + ErrnoText(errno);
    return false;
  }
  if ((stream_param.parm.capture.capability & V4L2_CAP_TIMEPERFRAME) == 0U) {
    error = "device does not advertise V4L2_CAP_TIMEPERFRAME";
    return false;
  }

  // V4L2 has a single frame interval; the shorter bound wins.
  stream_param.parm.capture.timeperframe.numerator = min_duration.numerator;
  stream_param.parm.capture.timeperframe.denominator = min_duration.denominator;
  if (IoctlRetry(fd_, VIDIOC_S_PARM, &stream_param) != 0) {
    error = "VIDIOC_S_PARM failed: " + ErrnoText(errno);
    return false;
  }

  if (IsValidFraction(stream_param.parm.capture.timeperframe)) {
    active_frame_duration_ = ToFrameDuration(stream_param.parm.capture.timeperframe);
  } else {
    active_frame_duration_ = min_duration;
  }
  return true;
}

bool V4l2CaptureDevice::SetZoomToMaximum(std::string& error) {
  error.clear();
  if (!RequireConfigurable("set zoom", error)) {
    return false;
  }
  if (!zoom_range_.has_value()) {
    error = "device has no writable V4L2_CID_ZOOM_ABSOLUTE control";
    return false;
  }

  v4l2_control control{};
  control.id = V4L2_CID_ZOOM_ABSOLUTE;
  control.value = zoom_range_->maximum;
  if (IoctlRetry(fd_, VIDIOC_S_CTRL, &control) != 0) {
    error = "VIDIOC_S_CTRL(zoom) failed: " + ErrnoText(errno);
    return false;
  }
  zoom_ = control.value;
  return true;
}

bool V4l2CaptureDevice::SetTorchMode(const TorchMode mode, std::string& error) {
  error.clear();
  if (!RequireConfigurable("set torch mode", error)) {
    return false;
  }
  if (!info_.has_torch) {
    error = "device has no V4L2_CID_FLASH_LED_MODE control";
    return false;
  }
  if (mode == TorchMode::kOn && !info_.torch_on_supported) {
    error = "flash LED does not offer torch mode";
    return false;
  }

  v4l2_control control{};
  control.id = V4L2_CID_FLASH_LED_MODE;
  control.value = mode == TorchMode::kOn ? V4L2_FLASH_LED_MODE_TORCH : V4L2_FLASH_LED_MODE_NONE;
  if (IoctlRetry(fd_, VIDIOC_S_CTRL, &control) != 0) {
    error = std::string("VIDIOC_S_CTRL(flash led mode=") + ToString(mode) +
            ") failed: " + ErrnoText(errno);
    return false;
  }
  torch_mode_ = mode;
  return true;
}

DeviceConfiguration V4l2CaptureDevice::ActiveConfiguration() const {
  DeviceConfiguration configuration;
  configuration.device_path = info_.device_path;
  configuration.device_name = info_.name;
  configuration.active_format = active_format_;
  configuration.min_frame_duration = active_frame_duration_;
  configuration.max_frame_duration = active_frame_duration_;
  configuration.zoom = zoom_;
  configuration.torch_mode = torch_mode_;
  return configuration;
}

bool V4l2CaptureDevice::StartStreaming(std::string& error) {
  error.clear();
  if (!IsOpen()) {
    error = "device must be open before streaming";
    return false;
  }
  if (streaming_) {
    return true;
  }
  if (!io_ops_.mmap_fn || !io_ops_.munmap_fn || !io_ops_.poll_fn) {
    error = "V4L2 streaming IO operations are not configured";
    return false;
  }

  v4l2_requestbuffers request{};
  request.count = requested_buffer_count_;
  request.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  request.memory = V4L2_MEMORY_MMAP;
  if (IoctlRetry(fd_, VIDIOC_REQBUFS, &request) != 0) {
    error = "VIDIOC_REQBUFS failed for '" + info_.device_path + "': " + ErrnoText(errno);
    return false;
  }
  if (request.count == 0U) {
    error = "driver granted no mmap buffers for '" + info_.device_path + "'";
    return false;
  }

  for (std::uint32_t index = 0U; index < request.count; ++index) {
    v4l2_buffer buffer{};
    buffer.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    buffer.memory = V4L2_MEMORY_MMAP;
    buffer.index = index;
    if (IoctlRetry(fd_, VIDIOC_QUERYBUF, &buffer) != 0) {
      error = "VIDIOC_QUERYBUF failed for buffer " + std::to_string(index) + ": " +
              ErrnoText(errno);
      ReleaseBuffers();
      return false;
    }

    void* address = io_ops_.mmap_fn(nullptr, buffer.length, PROT_READ | PROT_WRITE, MAP_SHARED,
                                    fd_, static_cast<std::int64_t>(buffer.m.offset));
    if (address == MAP_FAILED || address == nullptr) {
      error = "mmap failed for buffer " + std::to_string(index) + ": " + ErrnoText(errno);
      ReleaseBuffers();
      return false;
    }
    mmap_buffers_.push_back({.address = address, .length = buffer.length});
  }

  for (std::uint32_t index = 0U; index < mmap_buffers_.size(); ++index) {
    v4l2_buffer buffer{};
    buffer.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    buffer.memory = V4L2_MEMORY_MMAP;
    buffer.index = index;
    if (IoctlRetry(fd_, VIDIOC_QBUF, &buffer) != 0) {
      error = "VIDIOC_QBUF failed for buffer " + std::to_string(index) + ": " + ErrnoText(errno);
      ReleaseBuffers();
      return false;
    }
  }

  int buffer_type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  if (IoctlRetry(fd_, VIDIOC_STREAMON, &buffer_type) != 0) {
    error = "VIDIOC_STREAMON failed for '" + info_.device_path + "': " + ErrnoText(errno);
    ReleaseBuffers();
    return false;
  }

  streaming_ = true;
  return true;
}

bool V4l2CaptureDevice::StopStreaming(std::string& error) {
  error.clear();
  if (!streaming_) {
    return true;
  }

  int buffer_type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  if (IoctlRetry(fd_, VIDIOC_STREAMOFF, &buffer_type) != 0) {
    error = "VIDIOC_STREAMOFF failed for '" + info_.device_path + "': " + ErrnoText(errno);
  }
  ReleaseBuffers();
  streaming_ = false;
  return error.empty();
}

bool V4l2CaptureDevice::IsStreaming() const {
  return streaming_;
}

void V4l2CaptureDevice::ReleaseBuffers() {
  for (const MmapBuffer& buffer : mmap_buffers_) {
    if (io_ops_.munmap_fn) {
      (void)io_ops_.munmap_fn(buffer.address, buffer.length);
    }
  }
  mmap_buffers_.clear();

  v4l2_requestbuffers release{};
  release.count = 0U;
  release.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  release.memory = V4L2_MEMORY_MMAP;
  (void)IoctlRetry(fd_, VIDIOC_REQBUFS, &release);
}

FrameWaitResult V4l2CaptureDevice::WaitForFrame(const std::chrono::milliseconds timeout,
                                                Frame& frame, std::string& error) {
  error.clear();
  if (!streaming_) {
    error = "device is not streaming";
    return FrameWaitResult::kError;
  }

  const int poll_status = io_ops_.poll_fn(fd_, static_cast<int>(timeout.count()));
  if (poll_status == 0) {
    return FrameWaitResult::kTimeout;
  }
  if (poll_status < 0) {
    if (errno == EINTR) {
      return FrameWaitResult::kTimeout;
    }
    error = "poll failed for '" + info_.device_path + "': " + ErrnoText(errno);
    return FrameWaitResult::kError;
  }

  v4l2_buffer buffer{};
  buffer.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  buffer.memory = V4L2_MEMORY_MMAP;
  if (IoctlRetry(fd_, VIDIOC_DQBUF, &buffer) != 0) {
    if (errno == EAGAIN) {
      return FrameWaitResult::kTimeout;
    }
    error = "VIDIOC_DQBUF failed for '" + info_.device_path + "': " + ErrnoText(errno);
    return FrameWaitResult::kError;
  }
  if (buffer.index >= mmap_buffers_.size()) {
    error = "driver returned unknown buffer index " + std::to_string(buffer.index);
    return FrameWaitResult::kError;
  }

  const MmapBuffer& mapped = mmap_buffers_[buffer.index];
  const bool corrupted = (buffer.flags & V4L2_BUF_FLAG_ERROR) != 0U;
  if (!corrupted) {
    const std::size_t used = std::min<std::size_t>(buffer.bytesused, mapped.length);
    const auto* bytes = static_cast<const std::uint8_t*>(mapped.address);
    frame.data.assign(bytes, bytes + used);
    frame.sequence = buffer.sequence;
    frame.timestamp = std::chrono::system_clock::now();
    frame.bytes_per_line = bytes_per_line_;
    if (active_format_.has_value()) {
      frame.pixel_format = active_format_->pixel_format;
      frame.width = active_format_->width;
      frame.height = active_format_->height;
    }
  }

  if (IoctlRetry(fd_, VIDIOC_QBUF, &buffer) != 0) {
    error = "VIDIOC_QBUF requeue failed for buffer " + std::to_string(buffer.index) + ": " +
            ErrnoText(errno);
    return FrameWaitResult::kError;
  }
  if (corrupted) {
    error = "driver flagged buffer " + std::to_string(buffer.index) + " as corrupted";
    return FrameWaitResult::kError;
  }
  return FrameWaitResult::kFrame;
}

int V4l2CaptureDevice::IoctlRetry(const int fd, const unsigned long request, void* arg) const {
  if (!io_ops_.ioctl_fn) {
    errno = ENOSYS;
    return -1;
  }

  int status = -1;
  do {
    status = io_ops_.ioctl_fn(fd, request, arg);
  } while (status != 0 && errno == EINTR);
  return status;
}

} // namespace pulsecam::capture::linux_v4l2
