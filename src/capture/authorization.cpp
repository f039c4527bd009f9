#include "capture/authorization.hpp"

#include <cerrno>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;

namespace pulsecam::capture {

const char* ToString(const AuthorizationStatus status) {
  switch (status) {
  case AuthorizationStatus::kAuthorized:
    return "authorized";
  case AuthorizationStatus::kNotDetermined:
    return "not_determined";
  case AuthorizationStatus::kDenied:
    return "denied";
  case AuthorizationStatus::kRestricted:
    return "restricted";
  case AuthorizationStatus::kUnknown:
    return "unknown";
  }
  return "unknown";
}

DeviceNodeAuthorization::AccessFn DeviceNodeAuthorization::DefaultAccessFn() {
  return [](const char* path, const int mode) { return ::access(path, mode); };
}

DeviceNodeAuthorization::DeviceNodeAuthorization(fs::path device_dir, AccessFn access_fn)
    : device_dir_(std::move(device_dir)), access_fn_(std::move(access_fn)) {}

AuthorizationStatus DeviceNodeAuthorization::Status() {
  std::vector<fs::path> nodes;
  std::error_code ec;
  for (fs::directory_iterator it(device_dir_, ec), end; !ec && it != end; it.increment(ec)) {
    const fs::directory_entry& entry = *it;
    const std::string name = entry.path().filename().string();
    if (name.rfind("video", 0) != 0U) {
      continue;
    }
    std::error_code type_ec;
    if (entry.is_directory(type_ec)) {
      continue;
    }
    nodes.push_back(entry.path());
  }
  if (ec) {
    return AuthorizationStatus::kUnknown;
  }
  if (nodes.empty() || !access_fn_) {
    return AuthorizationStatus::kAuthorized;
  }

  bool saw_denied = false;
  bool saw_restricted = false;
  for (const fs::path& node : nodes) {
    if (access_fn_(node.c_str(), R_OK | W_OK) == 0) {
      return AuthorizationStatus::kAuthorized;
    }
    if (errno == EACCES || errno == EPERM) {
      saw_denied = true;
    } else if (errno == EROFS) {
      saw_restricted = true;
    }
  }

  if (saw_denied) {
    return AuthorizationStatus::kDenied;
  }
  if (saw_restricted) {
    return AuthorizationStatus::kRestricted;
  }
  return AuthorizationStatus::kUnknown;
}

bool DeviceNodeAuthorization::RequestAccess() {
  return Status() == AuthorizationStatus::kAuthorized;
}

} // namespace pulsecam::capture
