#ifndef FSTAB_HPP
#define FSTAB_HPP

#include "fsprov/error.hpp"
#include "fsprov/fs_tools.hpp"
#include "fsprov/host.hpp"
#include "fsprov/report.hpp"
#include "fsprov/spec.hpp"

#include <string>       // for string
#include <string_view>  // for string_view

namespace fsprov::fs {

struct FstabUpdate {
    std::string content{};
    bool changed{false};
};

// Build the fstab entry of a FilesystemSpec. When the filesystem is file-backed and
// attached to a loop device, the file becomes the source and 'loop=<device>' is
// appended to the options so that the mount comes back up on reboot.
auto make_fstab_entry(const FilesystemSpec& spec, std::string_view device) noexcept -> FstabEntry;

// Format one fstab line, without trailing newline
auto format_fstab_entry(const FstabEntry& entry) noexcept -> std::string;

// Insert entry into fstab content, or replace the line with the same mount point when it differs
auto upsert_fstab_content(std::string_view fstab_content, const FstabEntry& entry) noexcept -> FstabUpdate;

/// @brief Idempotently register the FilesystemSpec's mount point in the persistent mount table.
/// No-op without a mount point, or while the device is deferred.
auto enable_mount(HostOps& host, const tools::FsTools& tools, const FilesystemSpec& spec, std::string_view device) noexcept -> Result<ActionReport>;

}  // namespace fsprov::fs

#endif  // FSTAB_HPP
