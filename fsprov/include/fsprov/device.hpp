#ifndef DEVICE_HPP
#define DEVICE_HPP

#include "fsprov/error.hpp"
#include "fsprov/fs_tools.hpp"
#include "fsprov/host.hpp"
#include "fsprov/spec.hpp"

#include <chrono>       // for milliseconds
#include <cstdint>      // for int32_t
#include <string>       // for string
#include <string_view>  // for string_view

namespace fsprov::device {

inline constexpr std::int32_t kDeviceWaitAttempts{1000};
inline constexpr std::chrono::milliseconds kDeviceWaitInterval{300};

/// @brief Derive the device path of a filesystem.
///
/// Precedence: file (the loop device given in spec.device), vg (/dev/mapper/<vg>-<label>),
/// uuid (/dev/disk/by-uuid/<uuid>), device, then /dev/mapper/<label>.
/// Pure, performs no I/O.
[[nodiscard]] auto resolve_device(const FilesystemSpec& spec) noexcept -> std::string;

/// @brief Block until device exists.
/// Polls every kDeviceWaitInterval and fails with ErrorKind::Timeout after kDeviceWaitAttempts misses.
auto wait_for_device(HostOps& host, std::string_view device) noexcept -> Result<>;

/// Whether the action should be a no-op because device_defer is set and the
/// local device node has not appeared yet.
[[nodiscard]] auto is_deferred(HostOps& host, const tools::FsTools& tools, const FilesystemSpec& spec, std::string_view device) noexcept -> bool;

}  // namespace fsprov::device

#endif  // DEVICE_HPP
