#include "capture/linux/v4l2_device_provider.hpp"

#include "common/assertions.hpp"
#include "common/temp_dir.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <linux/videodev2.h>

namespace fs = std::filesystem;

namespace {

using pulsecam::capture::CaptureDeviceInfo;
using pulsecam::capture::ICaptureDevice;
using pulsecam::capture::linux_v4l2::DiscoverVideoNodes;
using pulsecam::capture::linux_v4l2::ParseVideoIndex;
using pulsecam::capture::linux_v4l2::ResolveDeviceDirectory;
using pulsecam::capture::linux_v4l2::V4l2CaptureDevice;
using pulsecam::capture::linux_v4l2::V4l2DeviceProvider;
using pulsecam::tests::common::AssertContains;
using pulsecam::tests::common::AssertTrue;
using pulsecam::tests::common::CreateUniqueTempDir;
using pulsecam::tests::common::Fail;
using pulsecam::tests::common::RemovePathBestEffort;
using pulsecam::tests::common::TouchFile;

// Node behaviour keyed by file name.
struct FakeNode {
  std::string card;
  std::uint32_t device_caps = V4L2_CAP_VIDEO_CAPTURE | V4L2_CAP_STREAMING;
  int open_errno = 0;
};

struct FakeNodeTable {
  std::map<std::string, FakeNode> nodes;
  std::map<int, std::string> open_fds;
  std::vector<std::string> opened_names;
  int next_fd = 30;
  std::uint32_t last_reqbufs_count = 0U;
};

V4l2CaptureDevice::IoOps MakeIoOps(FakeNodeTable& table) {
  V4l2CaptureDevice::IoOps ops;
  ops.open_fn = [&table](const char* path, int /*flags*/) {
    const std::string name = fs::path(path).filename().string();
    table.opened_names.push_back(name);
    const auto it = table.nodes.find(name);
    if (it == table.nodes.end()) {
      errno = ENOENT;
      return -1;
    }
    if (it->second.open_errno != 0) {
      errno = it->second.open_errno;
      return -1;
    }
    const int fd = table.next_fd++;
    table.open_fds[fd] = name;
    return fd;
  };
  ops.close_fn = [&table](const int fd) {
    table.open_fds.erase(fd);
    return 0;
  };
  ops.ioctl_fn = [&table](const int fd, const unsigned long request, void* arg) {
    if (request == VIDIOC_QUERYCAP) {
      const FakeNode& node = table.nodes.at(table.open_fds.at(fd));
      auto* capability = static_cast<v4l2_capability*>(arg);
      *capability = v4l2_capability{};
      capability->device_caps = node.device_caps;
      capability->capabilities = node.device_caps | V4L2_CAP_DEVICE_CAPS;
      std::snprintf(reinterpret_cast<char*>(capability->card), sizeof(capability->card), "%s",
                    node.card.c_str());
      return 0;
    }
    if (request == VIDIOC_REQBUFS) {
      auto* request_buffers = static_cast<v4l2_requestbuffers*>(arg);
      if (request_buffers->count != 0U) {
        table.last_reqbufs_count = request_buffers->count;
      }
      request_buffers->count = 0U;
      return 0;
    }
    errno = ENOTTY;
    return -1;
  };
  ops.mmap_fn = [](void*, std::size_t, int, int, int, std::int64_t) -> void* { return nullptr; };
  ops.munmap_fn = [](void*, std::size_t) { return 0; };
  ops.poll_fn = [](int, int) { return 0; };
  return ops;
}

void TestParseVideoIndex() {
  AssertTrue(ParseVideoIndex("video0") == 0U, "video0 is index 0");
  AssertTrue(ParseVideoIndex("video12") == 12U, "video12 is index 12");
  AssertTrue(!ParseVideoIndex("video").has_value(), "bare prefix has no index");
  AssertTrue(!ParseVideoIndex("video1a").has_value(), "trailing garbage has no index");
  AssertTrue(!ParseVideoIndex("media0").has_value(), "other nodes have no index");
}

void TestDiscoverOrdersNodesNumerically() {
  const fs::path dir = CreateUniqueTempDir("pulsecam-discover");
  TouchFile(dir / "video10");
  TouchFile(dir / "video2");
  TouchFile(dir / "video0");
  TouchFile(dir / "media0");
  fs::create_directories(dir / "video5");

  std::vector<fs::path> nodes;
  std::string error;
  AssertTrue(DiscoverVideoNodes(dir, nodes, error), "discovery must succeed: " + error);
  AssertTrue(nodes.size() == 3U, "only video files are discovered");
  AssertTrue(nodes[0].filename() == "video0" && nodes[1].filename() == "video2" &&
                 nodes[2].filename() == "video10",
             "nodes must be ordered by numeric index");

  AssertTrue(!DiscoverVideoNodes(dir / "missing", nodes, error), "missing dir must fail");
  AssertContains(error, "V4L2 discovery");

  TouchFile(dir / "not-a-dir");
  AssertTrue(!DiscoverVideoNodes(dir / "not-a-dir", nodes, error), "a file must not be listed");
  AssertContains(error, "failed to iterate");
  RemovePathBestEffort(dir);
}

void TestEnumerateSkipsNonCaptureNodes() {
  const fs::path dir = CreateUniqueTempDir("pulsecam-provider");
  TouchFile(dir / "video0");
  TouchFile(dir / "video1");
  TouchFile(dir / "video3");
  TouchFile(dir / "video10");

  FakeNodeTable table;
  table.nodes["video0"] = FakeNode{.card = "Front Camera"};
  table.nodes["video1"] =
      FakeNode{.card = "Front Camera", .device_caps = V4L2_CAP_META_CAPTURE | V4L2_CAP_STREAMING};
  table.nodes["video3"] = FakeNode{.card = "Busy", .open_errno = EBUSY};
  table.nodes["video10"] = FakeNode{.card = "Rear Camera"};

  V4l2DeviceProvider provider(dir, MakeIoOps(table));
  std::vector<CaptureDeviceInfo> devices;
  std::string error;
  AssertTrue(provider.EnumerateDevices(devices, error), "enumeration must succeed: " + error);
  AssertTrue(devices.size() == 3U, "metadata node must be skipped");
  AssertTrue(devices[0].name == "Front Camera" && devices[0].connected,
             "first device is the front camera");
  AssertTrue(devices[1].name == "video3" && !devices[1].connected,
             "unopenable node stays listed as disconnected");
  AssertContains(devices[1].probe_error, "failed to open");
  AssertTrue(devices[2].name == "Rear Camera", "numeric order puts video10 last");
  AssertTrue(table.open_fds.empty(), "every probed node must be closed");

  RemovePathBestEffort(dir);
}

void TestOpenDeviceUsesStreamingBufferCount() {
  const fs::path dir = CreateUniqueTempDir("pulsecam-provider-open");
  FakeNodeTable table;
  table.nodes["video4"] = FakeNode{.card = "Rear Camera"};

  V4l2DeviceProvider provider(dir, MakeIoOps(table));
  provider.SetStreamingBufferCount(6U);

  CaptureDeviceInfo info;
  info.device_path = (dir / "video4").string();
  std::string error;
  std::unique_ptr<ICaptureDevice> device = provider.OpenDevice(info, error);
  if (device == nullptr) {
    Fail("open failed: " + error);
  }
  AssertTrue(device->Info().name == "Rear Camera", "opened device must be queried");

  AssertTrue(!device->StartStreaming(error), "fake driver grants no buffers");
  AssertContains(error, "granted no mmap buffers");
  AssertTrue(table.last_reqbufs_count == 6U, "configured buffer count must be requested");

  CaptureDeviceInfo missing;
  missing.device_path = (dir / "video9").string();
  AssertTrue(provider.OpenDevice(missing, error) == nullptr, "unknown node must fail");
  AssertContains(error, "video9");

  device.reset();
  AssertTrue(table.open_fds.empty(), "destroying the device must close it");
  RemovePathBestEffort(dir);
}

void TestDeviceDirectoryFromEnvironment() {
  ::setenv("PULSECAM_DEVICE_DIR", "/tmp/pulsecam-fake-dev", 1);
  AssertTrue(ResolveDeviceDirectory() == fs::path("/tmp/pulsecam-fake-dev"),
             "environment override must be used");
  ::unsetenv("PULSECAM_DEVICE_DIR");
  AssertTrue(ResolveDeviceDirectory() == fs::path("/dev"), "default directory is /dev");
}

} // namespace

int main() {
  TestParseVideoIndex();
  TestDiscoverOrdersNodesNumerically();
  TestEnumerateSkipsNonCaptureNodes();
  TestOpenDeviceUsesStreamingBufferCount();
  TestDeviceDirectoryFromEnvironment();
  std::cout << "v4l2_device_provider_smoke: ok\n";
  return 0;
}
