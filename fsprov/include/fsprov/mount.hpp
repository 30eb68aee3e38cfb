#ifndef MOUNT_HPP
#define MOUNT_HPP

#include "fsprov/error.hpp"
#include "fsprov/fs_tools.hpp"
#include "fsprov/host.hpp"
#include "fsprov/report.hpp"
#include "fsprov/spec.hpp"

#include <string_view>  // for string_view

namespace fsprov::mount {

// Create the mount point directory, root owned with mode 755, unless path is already a mount point.
// Mount points should not have files in them and have no reason to be user writable.
auto ensure_mount_point(HostOps& host, std::string_view path) noexcept -> Result<ActionReport>;

/// @brief Idempotently mount device at the FilesystemSpec's mount point.
///
/// Afterwards the owner, group and mode of the FilesystemSpec are applied to the mounted
/// directory, except for network filesystems where root access may be squashed.
auto mount_filesystem(HostOps& host, const tools::FsTools& tools, const FilesystemSpec& spec, std::string_view device) noexcept -> Result<ActionReport>;

}  // namespace fsprov::mount

#endif  // MOUNT_HPP
