#pragma once

#include "capture/capture_device.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace pulsecam::capture::linux_v4l2 {

// Outcome of probing one device node without keeping it open.
enum class V4l2ProbeResult {
  kCaptureDevice = 0,
  // Node opened but is not a single-planar streaming capture device (for
  // example a UVC metadata node). Discovery skips these.
  kNotCaptureDevice,
  // Node could not be opened or queried.
  kUnavailable,
};

// `ICaptureDevice` backed by a V4L2 node with mmap streaming.
//
// Flashlight: `V4L2_CID_FLASH_LED_MODE` (torch/none). Configuration lock:
// `VIDIOC_S_PRIORITY` record priority, so no other file handle can change
// settings while the lock is held. Drivers without priority support
// (`ENOTTY`) are treated as lockable.
//
// All system calls go through `IoOps` so tests can run without hardware.
class V4l2CaptureDevice final : public ICaptureDevice {
public:
  struct IoOps {
    std::function<int(const char* path, int flags)> open_fn;
    std::function<int(int fd)> close_fn;
    std::function<int(int fd, unsigned long request, void* arg)> ioctl_fn;
    std::function<void*(void* addr, std::size_t length, int prot, int flags, int fd,
                        std::int64_t offset)>
        mmap_fn;
    std::function<int(void* addr, std::size_t length)> munmap_fn;
    // Returns >0 when readable, 0 on timeout, <0 on error (errno set).
    std::function<int(int fd, int timeout_ms)> poll_fn;
  };

  static IoOps DefaultIoOps();

  explicit V4l2CaptureDevice(IoOps io_ops = DefaultIoOps());
  ~V4l2CaptureDevice() override;

  V4l2CaptureDevice(const V4l2CaptureDevice&) = delete;
  V4l2CaptureDevice& operator=(const V4l2CaptureDevice&) = delete;

  bool Open(const std::string& device_path, std::string& error);
  bool Close(std::string& error);
  bool IsOpen() const;

  // Opens, reads identity and flashlight properties, and closes again.
  static V4l2ProbeResult Probe(const std::string& device_path, const IoOps& io_ops,
                               CaptureDeviceInfo& info, std::string& error);

  const CaptureDeviceInfo& Info() const override;
  bool EnumerateFormats(std::vector<CaptureFormat>& formats, std::string& error) override;

  bool LockForConfiguration(std::string& error) override;
  void UnlockForConfiguration() override;
  bool IsLockedForConfiguration() const;

  bool SetActiveFormat(const CaptureFormat& format, std::string& error) override;
  bool SetFrameDurations(FrameDuration min_duration, FrameDuration max_duration,
                         std::string& error) override;
  bool SetZoomToMaximum(std::string& error) override;
  bool SetTorchMode(TorchMode mode, std::string& error) override;

  DeviceConfiguration ActiveConfiguration() const override;

  bool StartStreaming(std::string& error) override;
  bool StopStreaming(std::string& error) override;
  bool IsStreaming() const override;

  FrameWaitResult WaitForFrame(std::chrono::milliseconds timeout, Frame& frame,
                               std::string& error) override;

  void SetRequestedBufferCount(std::uint32_t count);

private:
  struct MmapBuffer {
    void* address = nullptr;
    std::size_t length = 0U;
  };

  struct ControlRange {
    std::int32_t minimum = 0;
    std::int32_t maximum = 0;
  };

  bool OpenInternal(const std::string& device_path, bool& not_capture_device,
                    std::string& error);
  void QueryInputPower();
  void QueryOrientation();
  void QueryTorchControl();
  void QueryZoomControl();
  void ReadCurrentFormat();
  void ReadCurrentFrameDuration();
  void EnumerateFrameRateRanges(std::uint32_t pixel_format, std::uint32_t width,
                                std::uint32_t height, std::vector<FrameRateRange>& ranges);
  bool RequireConfigurable(const char* action, std::string& error) const;
  void ReleaseBuffers();
  int IoctlRetry(int fd, unsigned long request, void* arg) const;

  IoOps io_ops_;
  int fd_ = -1;
  std::uint32_t requested_buffer_count_ = 4U;
  CaptureDeviceInfo info_;

  std::optional<CaptureFormat> active_format_;
  std::uint32_t bytes_per_line_ = 0U;
  FrameDuration active_frame_duration_;
  std::optional<ControlRange> zoom_range_;
  std::optional<std::int32_t> zoom_;
  TorchMode torch_mode_ = TorchMode::kOff;

  bool locked_ = false;
  bool priority_raised_ = false;
  std::vector<MmapBuffer> mmap_buffers_;
  bool streaming_ = false;
};

} // namespace pulsecam::capture::linux_v4l2
