#pragma once

#include <filesystem>
#include <functional>

namespace pulsecam::capture {

enum class AuthorizationStatus {
  kAuthorized = 0,
  kNotDetermined,
  kDenied,
  kRestricted,
  kUnknown,
};

const char* ToString(AuthorizationStatus status);

// Camera-use permission gate consulted before every start.
class IAuthorizationProvider {
public:
  virtual ~IAuthorizationProvider() = default;

  // Cached answer; never prompts.
  virtual AuthorizationStatus Status() = 0;

  // Asks for access and blocks until answered. Only meaningful while
  // `Status()` is `kNotDetermined`. Returns true when access was granted.
  virtual bool RequestAccess() = 0;
};

// Linux gate based on device node permissions under one directory.
//
// - no `video*` node present: authorized (nothing to gate; a missing camera
//   is reported separately)
// - any node readable and writable: authorized
// - otherwise `EACCES`/`EPERM`: denied, `EROFS`: restricted, other: unknown
//
// Node permissions cannot be granted interactively, so `RequestAccess` only
// re-evaluates the nodes.
class DeviceNodeAuthorization final : public IAuthorizationProvider {
public:
  using AccessFn = std::function<int(const char* path, int mode)>;

  static AccessFn DefaultAccessFn();

  explicit DeviceNodeAuthorization(std::filesystem::path device_dir,
                                   AccessFn access_fn = DefaultAccessFn());

  AuthorizationStatus Status() override;
  bool RequestAccess() override;

private:
  std::filesystem::path device_dir_;
  AccessFn access_fn_;
};

} // namespace pulsecam::capture
