#ifndef MKFS_HPP
#define MKFS_HPP

#include "fsprov/error.hpp"
#include "fsprov/fs_tools.hpp"
#include "fsprov/host.hpp"
#include "fsprov/report.hpp"
#include "fsprov/spec.hpp"

#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace fsprov::mkfs {

// Packages needed for spec.fstype: the tool table's ones followed by spec.package entries
auto required_packages(const tools::FsTools& tools, const FilesystemSpec& spec) noexcept -> std::vector<std::string>;

// mkfs -t <fstype> [<forceopt>] <mkfs_options> -L <label> <device>
// forceopt only when spec.force is set, e.g "mkfs -t xfs  -L data /dev/sdb1" without options
auto build_mkfs_command(const tools::FsTools& tools, const FilesystemSpec& spec, std::string_view device) noexcept -> std::string;

/// @brief Create the filesystem on device unless one of the guards applies.
///
/// Guards, in order: device already mounted, mkfs.<fstype> missing (without force),
/// device already holding a mountable filesystem (without ignore_existing).
/// The required packages are installed before the tool check.
auto format_device(HostOps& host, const tools::FsTools& tools, const FilesystemSpec& spec, std::string_view device) noexcept -> Result<ActionReport>;

}  // namespace fsprov::mkfs

#endif  // MKFS_HPP
