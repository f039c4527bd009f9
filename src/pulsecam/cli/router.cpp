#include "pulsecam/cli/router.hpp"

#include "capture/authorization.hpp"
#include "capture/capture_controller.hpp"
#include "capture/device_selection.hpp"
#include "capture/linux/v4l2_device_provider.hpp"
#include "core/errors/exit_codes.hpp"
#include "preview/opencv_support.hpp"
#include "preview/presentation_model.hpp"
#include "preview/update_context.hpp"
#include "view/status_view.hpp"
#include "view/terminal_preview.hpp"

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace pulsecam::cli {

namespace {

constexpr std::string_view kVersion = "0.1.0";

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitMissingDevice = core::errors::ToInt(core::errors::ExitCode::kMissingDevice);
constexpr int kExitUnauthorized = core::errors::ToInt(core::errors::ExitCode::kUnauthorized);

constexpr auto kRefreshInterval = std::chrono::milliseconds(100);
constexpr std::uint32_t kAsciiColumns = 64U;
constexpr std::uint32_t kAsciiRows = 20U;

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  pulsecam devices [--log-level <debug|info|warn|error>]\n"
      << "  pulsecam preview [--duration-ms <n>] [--buffer <unbounded|newest:<n>>] [--ascii] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  pulsecam version\n"
      << "\n"
      << "environment:\n"
      << "  PULSECAM_DEVICE_DIR  directory scanned for video* nodes (default /dev)\n"
      << "  PULSECAM_LOG_LEVEL   default log level (overridden by --log-level)\n";
}

bool ParseLogLevelOption(const std::vector<std::string_view>& args, std::size_t& i,
                         std::optional<core::logging::LogLevel>& level, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for --log-level";
    return false;
  }
  core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
  if (!core::logging::ParseLogLevel(args[i + 1], parsed, error)) {
    return false;
  }
  level = parsed;
  ++i;
  return true;
}

bool ParsePositiveMillis(std::string_view text, std::chrono::milliseconds& value,
                         std::string& error) {
  std::int64_t parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (text.empty() || ec != std::errc() || ptr != end || parsed <= 0) {
    error = "--duration-ms must be a positive integer, got '" + std::string(text) + "'";
    return false;
  }
  value = std::chrono::milliseconds(parsed);
  return true;
}

// Environment first, then the flag.
void ConfigureLogger(core::logging::Logger& logger,
                     const std::optional<core::logging::LogLevel>& flag_level) {
  core::logging::LogLevel level = core::logging::LogLevel::kInfo;
  std::string env_error;
  if (!core::logging::LogLevelFromEnvironment(level, env_error) && !env_error.empty() &&
      !flag_level.has_value()) {
    std::cerr << "warning: " << env_error << '\n';
  }
  if (flag_level.has_value()) {
    level = flag_level.value();
  }
  logger.SetMinLevel(level);
}

std::string FormatFps(const double fps) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << fps;
  return out.str();
}

int ExitCodeFor(const capture::CaptureStatus status, const capture::CaptureError& last_error) {
  switch (status) {
  case capture::CaptureStatus::kMissingDevice:
    return kExitMissingDevice;
  case capture::CaptureStatus::kUnauthorized:
    return kExitUnauthorized;
  case capture::CaptureStatus::kUninitialized:
    return kExitFailure;
  case capture::CaptureStatus::kRunning:
  case capture::CaptureStatus::kStopped:
    break;
  }
  if (last_error.code == capture::CaptureErrorCode::kSessionStartFailed) {
    return kExitFailure;
  }
  return kExitSuccess;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "pulsecam " << kVersion << '\n'
            << "opencv: " << preview::OpenCvStatusText() << " (" << preview::OpenCvDetail()
            << ")\n";
  return kExitSuccess;
}

int CommandDevices(const std::vector<std::string_view>& args) {
  DevicesOptions options;
  std::string error;
  if (!ParseDevicesOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::logging::Logger logger;
  ConfigureLogger(logger, options.log_level);
  logger.SetComponent("devices");

  capture::linux_v4l2::V4l2DeviceProvider provider;
  std::vector<capture::CaptureDeviceInfo> devices;
  if (!provider.EnumerateDevices(devices, error)) {
    logger.Error("device enumeration failed", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  logger.Debug("device enumeration complete",
               {{"directory", provider.DeviceDirectory().string()},
                {"count", std::to_string(devices.size())}});

  const std::optional<std::size_t> selected = capture::SelectCaptureDevice(devices);
  for (std::size_t i = 0; i < devices.size(); ++i) {
    const capture::CaptureDeviceInfo& device = devices[i];
    const capture::DeviceEligibility verdict = capture::EvaluateDeviceEligibility(device);
    std::cout << (selected.has_value() && selected.value() == i ? "* " : "  ")
              << device.device_path << " name=\"" << device.name << "\""
              << " position=" << capture::ToString(device.position)
              << " torch=" << (device.has_torch ? "yes" : "no")
              << " eligible=" << (verdict.eligible ? "yes" : "no");
    if (!verdict.eligible) {
      std::cout << " reason=\"" << verdict.reason << "\"";
    }
    std::cout << '\n';
  }

  if (!selected.has_value()) {
    std::cout << "no eligible camera/flashlight device among " << devices.size()
              << " candidate(s)\n";
    return kExitMissingDevice;
  }
  return kExitSuccess;
}

void RenderPreviewFrame(const preview::PresentationModel& model,
                        const capture::CaptureController& controller, const bool ascii) {
  const capture::CaptureStatus status = model.CameraStatus();
  const std::string text = view::PreviewText(status);

  if (ascii) {
    std::cout << "\x1b[H\x1b[2J";
    if (text.empty()) {
      if (const std::optional<preview::PreviewImage> image = model.ViewfinderImage();
          image.has_value()) {
        const std::vector<std::string> lines =
            view::RenderAscii(image.value(), kAsciiColumns, kAsciiRows);
        for (const std::string& line : lines) {
          std::cout << line << '\n';
        }
      }
    }
  }

  std::cout << "status=" << capture::ToString(status);
  if (!text.empty()) {
    std::cout << " text=\"" << text << "\"";
  } else {
    std::cout << " frames=" << model.PresentedFrameCount()
              << " fps=" << FormatFps(controller.FrameRate());
  }
  std::cout << '\n';
  std::cout.flush();
}

int CommandPreview(const std::vector<std::string_view>& args) {
  PreviewOptions options;
  std::string error;
  if (!ParsePreviewOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::logging::Logger logger;
  ConfigureLogger(logger, options.log_level);
  logger.SetComponent("preview");

  const std::filesystem::path device_dir = capture::linux_v4l2::ResolveDeviceDirectory();
  capture::linux_v4l2::V4l2DeviceProvider provider(device_dir);
  capture::DeviceNodeAuthorization authorization(device_dir);

  capture::CaptureControllerOptions controller_options;
  controller_options.frame_buffering = options.buffering;
  capture::CaptureController controller(provider, authorization, logger, controller_options);

  preview::MainLoopContext ui;
  capture::CaptureStatus final_status = capture::CaptureStatus::kUninitialized;
  {
    // The model observes the controller and must go first.
    preview::PresentationModel model(controller, ui, logger);
    (void)ui.RunPending();

    (void)view::InvokeControl(view::ControlFor(model.CameraStatus()), controller);
    (void)ui.RunPending();
    logger.Info("preview started",
                {{"status", capture::ToString(model.CameraStatus())},
                 {"buffering", core::async::ToString(options.buffering)},
                 {"duration_ms", std::to_string(options.duration.count())}});

    const auto deadline = std::chrono::steady_clock::now() + options.duration;
    while (std::chrono::steady_clock::now() < deadline) {
      (void)ui.RunPending();
      RenderPreviewFrame(model, controller, options.ascii);
      if (!view::ControlFor(model.CameraStatus()).enabled) {
        break;
      }
      std::this_thread::sleep_for(kRefreshInterval);
    }

    (void)ui.RunPending();
    const view::ControlState control = view::ControlFor(model.CameraStatus());
    if (control.action == view::ControlAction::kStop) {
      (void)view::InvokeControl(control, controller);
    }
    (void)ui.RunPending();
    RenderPreviewFrame(model, controller, false);
    final_status = model.CameraStatus();

    logger.Info("preview finished",
                {{"status", capture::ToString(final_status)},
                 {"presented_frames", std::to_string(model.PresentedFrameCount())},
                 {"rejected_frames", std::to_string(model.RejectedFrameCount())},
                 {"dropped_frames", std::to_string(controller.PreviewStream().DroppedCount())}});
  }

  const capture::CaptureError last_error = controller.LastError();
  if (last_error.HasError()) {
    std::cerr << "last error: " << capture::ToString(last_error.code) << ": " << last_error.detail
              << '\n';
  }
  return ExitCodeFor(final_status, last_error);
}

} // namespace

bool ParseDevicesOptions(const std::vector<std::string_view>& args, DevicesOptions& options,
                         std::string& error) {
  error.clear();
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--log-level") {
      if (!ParseLogLevelOption(args, i, options.log_level, error)) {
        return false;
      }
      continue;
    }
    error = "unknown option: " + std::string(token);
    return false;
  }
  return true;
}

bool ParsePreviewOptions(const std::vector<std::string_view>& args, PreviewOptions& options,
                         std::string& error) {
  error.clear();
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--ascii") {
      options.ascii = true;
      continue;
    }
    if (token == "--duration-ms") {
      if (i + 1 >= args.size()) {
        error = "missing value for --duration-ms";
        return false;
      }
      if (!ParsePositiveMillis(args[i + 1], options.duration, error)) {
        return false;
      }
      ++i;
      continue;
    }
    if (token == "--buffer") {
      if (i + 1 >= args.size()) {
        error = "missing value for --buffer";
        return false;
      }
      if (!core::async::ParseBufferingPolicy(args[i + 1], options.buffering, error)) {
        return false;
      }
      ++i;
      continue;
    }
    if (token == "--log-level") {
      if (!ParseLogLevelOption(args, i, options.log_level, error)) {
        return false;
      }
      continue;
    }
    error = "unknown option: " + std::string(token);
    return false;
  }
  return true;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "devices") {
    return CommandDevices(args);
  }

  if (command == "preview") {
    return CommandPreview(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace pulsecam::cli
