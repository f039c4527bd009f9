#pragma once

#include "capture/capture_device.hpp"
#include "capture/linux/v4l2_capture_device.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pulsecam::capture::linux_v4l2 {

// Directory scanned for `video*` nodes: `PULSECAM_DEVICE_DIR` when set,
// otherwise `/dev`.
std::filesystem::path ResolveDeviceDirectory();

// "video12" -> 12. Anything else -> nullopt.
std::optional<std::size_t> ParseVideoIndex(std::string_view node_name);

// Lists `video*` entries under `directory` in numeric node order.
bool DiscoverVideoNodes(const std::filesystem::path& directory,
                        std::vector<std::filesystem::path>& nodes, std::string& error);

// Device provider over V4L2 nodes.
//
// Every node is probed once per enumeration. Nodes that are not capture
// devices (metadata, output-only) are skipped; nodes that fail to open are
// still listed as disconnected so the selection log can say why.
class V4l2DeviceProvider final : public ICaptureDeviceProvider {
public:
  explicit V4l2DeviceProvider(std::filesystem::path device_dir = ResolveDeviceDirectory(),
                              V4l2CaptureDevice::IoOps io_ops = V4l2CaptureDevice::DefaultIoOps());

  bool EnumerateDevices(std::vector<CaptureDeviceInfo>& devices, std::string& error) override;
  std::unique_ptr<ICaptureDevice> OpenDevice(const CaptureDeviceInfo& info,
                                             std::string& error) override;

  const std::filesystem::path& DeviceDirectory() const {
    return device_dir_;
  }

  // mmap buffers requested by devices opened from now on.
  void SetStreamingBufferCount(std::uint32_t count) {
    streaming_buffer_count_ = count;
  }

private:
  std::filesystem::path device_dir_;
  V4l2CaptureDevice::IoOps io_ops_;
  std::uint32_t streaming_buffer_count_ = 4U;
};

} // namespace pulsecam::capture::linux_v4l2
