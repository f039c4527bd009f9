#pragma once

#include "core/async/async_stream.hpp"
#include "core/logging/logger.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pulsecam::cli {

struct DevicesOptions {
  std::optional<core::logging::LogLevel> log_level;
};

struct PreviewOptions {
  std::chrono::milliseconds duration{5000};
  core::async::BufferingPolicy buffering = core::async::BufferingPolicy::Unbounded();
  bool ascii = false;
  std::optional<core::logging::LogLevel> log_level;
};

// Argument parsers are exposed so tests can pin the option contract without
// touching hardware.
bool ParseDevicesOptions(const std::vector<std::string_view>& args, DevicesOptions& options,
                         std::string& error);
bool ParsePreviewOptions(const std::vector<std::string_view>& args, PreviewOptions& options,
                         std::string& error);

// Routes `pulsecam` subcommands and returns process exit codes with a stable
// contract for scripts:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   20 => no usable camera with a flashlight
//   21 => camera access not authorized
int Dispatch(int argc, char** argv);

} // namespace pulsecam::cli
