#include "fsprov/mount.hpp"
#include "fsprov/device.hpp"

#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>

namespace fsprov::mount {

auto ensure_mount_point(HostOps& host, std::string_view path) noexcept -> Result<ActionReport> {
    ActionReport report{};
    if (host.is_mount_point(path)) {
        return report;
    }

    const DirectoryRequest request{
        .path      = std::string{path},
        .owner     = "root",
        .group     = "root",
        .mode      = "755",
        .recursive = true,
    };
    auto created = host.ensure_directory(request);
    if (!created) {
        return std::unexpected(std::move(created.error()));
    }
    if (*created) {
        report.add_change(fmt::format(FMT_COMPILE("created mount point {}"), path));
    }
    return report;
}

auto mount_filesystem(HostOps& host, const tools::FsTools& tools, const FilesystemSpec& spec, std::string_view device) noexcept -> Result<ActionReport> {
    ActionReport report{};
    if (!spec.mount) {
        report.skip("no mount point configured");
        return report;
    }
    const auto& mountpoint = *spec.mount;

    auto mount_point = ensure_mount_point(host, mountpoint);
    if (!mount_point) {
        return std::unexpected(std::move(mount_point.error()));
    }
    report.merge(std::move(*mount_point));

    if (device::is_deferred(host, tools, spec, device)) {
        report.skip(fmt::format(FMT_COMPILE("device {} does not exist yet, deferring mount"), device));
        return report;
    }

    if (!host.is_mounted_at(device, mountpoint)) {
        const MountRequest request{
            .device     = std::string{device},
            .mountpoint = mountpoint,
            .fstype     = spec.fstype,
            .options    = spec.options,
        };
        if (auto mounted = host.mount(request); !mounted) {
            return std::unexpected(std::move(mounted.error()));
        }
        report.add_change(fmt::format(FMT_COMPILE("mounted {} at {}"), device, mountpoint));
    }

    // NFS4 file systems in particular should not allow root access
    if (tools.is_network_fs(spec.fstype) || !host.is_mount_point(mountpoint)) {
        return report;
    }

    const DirectoryRequest request{
        .path      = mountpoint,
        .owner     = spec.user,
        .group     = spec.group,
        .mode      = spec.mode,
        .recursive = true,
    };
    auto updated = host.ensure_directory(request);
    if (!updated) {
        return std::unexpected(std::move(updated.error()));
    }
    if (*updated) {
        report.add_change(fmt::format(FMT_COMPILE("updated ownership and mode of {}"), mountpoint));
    }
    return report;
}

}  // namespace fsprov::mount
