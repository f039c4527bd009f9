#pragma once

#include "capture/capture_format.hpp"
#include "capture/frame.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pulsecam::capture {

// Which way the sensor faces, as reported by the driver. Devices that do not
// report an orientation are `kUnspecified`.
enum class DevicePosition {
  kUnspecified = 0,
  kFront,
  kBack,
  kExternal,
};

enum class TorchMode {
  kOff = 0,
  kOn,
};

const char* ToString(DevicePosition position);
const char* ToString(TorchMode mode);

// Identity and selection-relevant properties of one capture device.
struct CaptureDeviceInfo {
  std::string device_path;
  std::string name;
  std::string driver;
  std::string bus_info;
  DevicePosition position = DevicePosition::kUnspecified;
  bool connected = false;
  bool suspended = false;
  // A flashlight control exists.
  bool has_torch = false;
  // The flashlight control is currently writable.
  bool torch_available = false;
  // The flashlight control offers a continuous torch mode.
  bool torch_on_supported = false;
  // Why probing failed when `connected` is false.
  std::string probe_error;
};

// Settings currently applied on the device.
struct DeviceConfiguration {
  std::string device_path;
  std::string device_name;
  std::optional<CaptureFormat> active_format;
  FrameDuration min_frame_duration;
  FrameDuration max_frame_duration;
  std::optional<std::int32_t> zoom;
  TorchMode torch_mode = TorchMode::kOff;

  // Derived from `max_frame_duration`; 0 when no duration is known.
  double FrameRate() const {
    return max_frame_duration.FrameRate();
  }
};

enum class FrameWaitResult {
  kFrame = 0,
  kTimeout,
  kError,
};

// Native device handle: one opened camera plus its flashlight.
//
// Contract:
// - every setter requires `LockForConfiguration` to have succeeded and fails
//   with an explanatory error otherwise
// - `WaitForFrame` is only called by the frame delivery thread while
//   streaming; setters may run concurrently from the session queue
class ICaptureDevice {
public:
  virtual ~ICaptureDevice() = default;

  virtual const CaptureDeviceInfo& Info() const = 0;

  virtual bool EnumerateFormats(std::vector<CaptureFormat>& formats, std::string& error) = 0;

  virtual bool LockForConfiguration(std::string& error) = 0;
  virtual void UnlockForConfiguration() = 0;

  virtual bool SetActiveFormat(const CaptureFormat& format, std::string& error) = 0;
  virtual bool SetFrameDurations(FrameDuration min_duration, FrameDuration max_duration,
                                 std::string& error) = 0;
  virtual bool SetZoomToMaximum(std::string& error) = 0;
  virtual bool SetTorchMode(TorchMode mode, std::string& error) = 0;

  virtual DeviceConfiguration ActiveConfiguration() const = 0;

  virtual bool StartStreaming(std::string& error) = 0;
  virtual bool StopStreaming(std::string& error) = 0;
  virtual bool IsStreaming() const = 0;

  // Blocks up to `timeout` for the next frame.
  virtual FrameWaitResult WaitForFrame(std::chrono::milliseconds timeout, Frame& frame,
                                       std::string& error) = 0;
};

// Source of candidate devices. Enumeration order is the selection order.
class ICaptureDeviceProvider {
public:
  virtual ~ICaptureDeviceProvider() = default;

  virtual bool EnumerateDevices(std::vector<CaptureDeviceInfo>& devices, std::string& error) = 0;

  // Returns nullptr and sets `error` when the device cannot be opened.
  virtual std::unique_ptr<ICaptureDevice> OpenDevice(const CaptureDeviceInfo& info,
                                                     std::string& error) = 0;
};

} // namespace pulsecam::capture
