#include "capture/linux/v4l2_device_provider.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace pulsecam::capture::linux_v4l2 {

namespace {

constexpr std::string_view kNodePrefix = "video";

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
}

} // namespace

fs::path ResolveDeviceDirectory() {
  const char* raw = std::getenv("PULSECAM_DEVICE_DIR");
  if (raw != nullptr && *raw != '\0') {
    return fs::path(raw);
  }
  return fs::path("/dev");
}

std::optional<std::size_t> ParseVideoIndex(std::string_view node_name) {
  if (!StartsWith(node_name, kNodePrefix)) {
    return std::nullopt;
  }
  const std::string_view suffix = node_name.substr(kNodePrefix.size());
  if (suffix.empty()) {
    return std::nullopt;
  }

  std::size_t parsed = 0;
  const char* begin = suffix.data();
  const char* end = begin + suffix.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return parsed;
}

bool DiscoverVideoNodes(const fs::path& directory, std::vector<fs::path>& nodes,
                        std::string& error) {
  nodes.clear();
  error.clear();

  std::error_code ec;
  fs::directory_iterator it(directory, ec);
  if (ec) {
    error = "failed to iterate " + directory.string() + " for V4L2 discovery: " + ec.message();
    return false;
  }
  for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
    const fs::directory_entry& entry = *it;
    std::error_code type_ec;
    if (entry.is_directory(type_ec)) {
      continue;
    }

    const std::string name = entry.path().filename().string();
    if (!StartsWith(name, kNodePrefix)) {
      continue;
    }
    nodes.push_back(entry.path());
  }
  if (ec) {
    error = "failed to iterate " + directory.string() + " for V4L2 discovery: " + ec.message();
    return false;
  }

  std::sort(nodes.begin(), nodes.end(), [](const fs::path& left, const fs::path& right) {
    const std::optional<std::size_t> left_index = ParseVideoIndex(left.filename().string());
    const std::optional<std::size_t> right_index = ParseVideoIndex(right.filename().string());
    if (left_index.has_value() && right_index.has_value() &&
        left_index.value() != right_index.value()) {
      return left_index.value() < right_index.value();
    }
    return left.string() < right.string();
  });
  return true;
}

V4l2DeviceProvider::V4l2DeviceProvider(fs::path device_dir, V4l2CaptureDevice::IoOps io_ops)
    : device_dir_(std::move(device_dir)), io_ops_(std::move(io_ops)) {}

bool V4l2DeviceProvider::EnumerateDevices(std::vector<CaptureDeviceInfo>& devices,
                                          std::string& error) {
  devices.clear();
  error.clear();

  std::vector<fs::path> nodes;
  if (!DiscoverVideoNodes(device_dir_, nodes, error)) {
    return false;
  }

  for (const fs::path& node : nodes) {
    CaptureDeviceInfo info;
    std::string probe_error;
    const V4l2ProbeResult result =
        V4l2CaptureDevice::Probe(node.string(), io_ops_, info, probe_error);
    if (result == V4l2ProbeResult::kNotCaptureDevice) {
      continue;
    }
    devices.push_back(std::move(info));
  }
  return true;
}

std::unique_ptr<ICaptureDevice> V4l2DeviceProvider::OpenDevice(const CaptureDeviceInfo& info,
                                                               std::string& error) {
  error.clear();
  auto device = std::make_unique<V4l2CaptureDevice>(io_ops_);
  device->SetRequestedBufferCount(streaming_buffer_count_);
  if (!device->Open(info.device_path, error)) {
    return nullptr;
  }
  return device;
}

} // namespace pulsecam::capture::linux_v4l2
