#include "pulsecam/cli/router.hpp"

#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/temp_dir.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

using pulsecam::cli::DevicesOptions;
using pulsecam::cli::PreviewOptions;
using pulsecam::core::async::BufferingPolicy;
using pulsecam::core::logging::LogLevel;
using pulsecam::tests::common::AssertContains;
using pulsecam::tests::common::AssertTrue;
using pulsecam::tests::common::CreateUniqueTempDir;
using pulsecam::tests::common::DispatchArgs;
using pulsecam::tests::common::RemovePathBestEffort;

// Swaps the rdbuf of one standard stream for the lifetime of the object.
class StreamCapture {
public:
  explicit StreamCapture(std::ostream& stream) : stream_(stream), previous_(stream.rdbuf()) {
    stream_.rdbuf(buffer_.rdbuf());
  }
  ~StreamCapture() {
    stream_.rdbuf(previous_);
  }

  std::string Text() const {
    return buffer_.str();
  }

private:
  std::ostream& stream_;
  std::streambuf* previous_;
  std::ostringstream buffer_;
};

void TestVersion() {
  StreamCapture out(std::cout);
  AssertTrue(DispatchArgs({"pulsecam", "version"}) == 0, "version must succeed");
  AssertContains(out.Text(), "pulsecam 0.1.0");
  AssertContains(out.Text(), "opencv: ");
}

void TestUsageErrors() {
  StreamCapture err(std::cerr);
  AssertTrue(DispatchArgs({"pulsecam"}) == 2, "missing command is a usage error");
  AssertTrue(DispatchArgs({"pulsecam", "record"}) == 2, "unknown command is a usage error");
  AssertContains(err.Text(), "unknown subcommand: record");
  AssertTrue(DispatchArgs({"pulsecam", "version", "--verbose"}) == 2,
             "version rejects arguments");
  AssertTrue(DispatchArgs({"pulsecam", "devices", "--bogus"}) == 2,
             "unknown devices option is a usage error");
  AssertTrue(DispatchArgs({"pulsecam", "preview", "--duration-ms", "0"}) == 2,
             "zero duration is a usage error");
  AssertContains(err.Text(), "--duration-ms must be a positive integer");
}

void TestParsePreviewOptions() {
  PreviewOptions options;
  std::string error;
  const std::vector<std::string_view> args = {"--duration-ms", "1500", "--buffer", "newest:3",
                                              "--ascii", "--log-level", "debug"};
  AssertTrue(pulsecam::cli::ParsePreviewOptions(args, options, error), error);
  AssertTrue(options.duration == std::chrono::milliseconds(1500), "duration must parse");
  AssertTrue(options.buffering.kind == BufferingPolicy::Kind::kBufferingNewest &&
                 options.buffering.limit == 3U,
             "buffering must parse");
  AssertTrue(options.ascii, "ascii flag must parse");
  AssertTrue(options.log_level == LogLevel::kDebug, "log level must parse");

  PreviewOptions defaults;
  AssertTrue(pulsecam::cli::ParsePreviewOptions({}, defaults, error), error);
  AssertTrue(defaults.duration == std::chrono::milliseconds(5000), "default duration");
  AssertTrue(defaults.buffering.kind == BufferingPolicy::Kind::kUnbounded,
             "default buffering is unbounded");

  AssertTrue(!pulsecam::cli::ParsePreviewOptions({"--buffer", "newest:0"}, options, error),
             "zero buffer limit must fail");
  AssertContains(error, "invalid buffering policy");
  AssertTrue(!pulsecam::cli::ParsePreviewOptions({"--duration-ms"}, options, error),
             "missing duration value must fail");
  AssertContains(error, "missing value for --duration-ms");
  AssertTrue(!pulsecam::cli::ParsePreviewOptions({"--duration-ms", "12ms"}, options, error),
             "non-numeric duration must fail");
}

void TestParseDevicesOptions() {
  DevicesOptions options;
  std::string error;
  AssertTrue(pulsecam::cli::ParseDevicesOptions({"--log-level", "WARN"}, options, error), error);
  AssertTrue(options.log_level == LogLevel::kWarn, "log level is case-insensitive");
  AssertTrue(!pulsecam::cli::ParseDevicesOptions({"--log-level", "loud"}, options, error),
             "invalid level must fail");
  AssertContains(error, "invalid log level 'loud'");
}

void TestMissingDeviceExitCodes() {
  const std::filesystem::path dir = CreateUniqueTempDir("pulsecam-cli");
  ::setenv("PULSECAM_DEVICE_DIR", dir.c_str(), 1);

  {
    StreamCapture out(std::cout);
    StreamCapture err(std::cerr);
    AssertTrue(DispatchArgs({"pulsecam", "devices"}) == 20,
               "devices without cameras must exit with missing-device code");
    AssertContains(out.Text(), "no eligible camera/flashlight device among 0 candidate(s)");
  }

  {
    StreamCapture out(std::cout);
    StreamCapture err(std::cerr);
    AssertTrue(DispatchArgs({"pulsecam", "preview", "--duration-ms", "2000"}) == 20,
               "preview without cameras must exit with missing-device code");
    AssertContains(out.Text(), "status=missing_device");
    AssertContains(err.Text(), "last error: ");
  }

  ::unsetenv("PULSECAM_DEVICE_DIR");
  RemovePathBestEffort(dir);
}

void TestMissingDeviceDirectoryFailsEnumeration() {
  const std::filesystem::path dir = CreateUniqueTempDir("pulsecam-cli-missing");
  RemovePathBestEffort(dir);
  ::setenv("PULSECAM_DEVICE_DIR", dir.c_str(), 1);

  StreamCapture err(std::cerr);
  AssertTrue(DispatchArgs({"pulsecam", "devices"}) == 1,
             "unreadable device directory is a command failure");
  AssertContains(err.Text(), "V4L2 discovery");

  ::unsetenv("PULSECAM_DEVICE_DIR");
}

} // namespace

int main() {
  TestVersion();
  TestUsageErrors();
  TestParsePreviewOptions();
  TestParseDevicesOptions();
  TestMissingDeviceExitCodes();
  TestMissingDeviceDirectoryFailsEnumeration();
  std::cout << "cli_smoke: ok\n";
  return 0;
}
