#ifndef SYSTEM_HOST_HPP
#define SYSTEM_HOST_HPP

#include "fsprov/fs_tools.hpp"
#include "fsprov/host.hpp"

#include <cstdint>      // for uint32_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace fsprov {

/// Locations of host state touched by SystemHost.
struct SystemPaths {
    std::string fstab{"/etc/fstab"};
    std::string mounts{"/proc/self/mounts"};
    // scratch mount points of probe_mountable
    std::string probe_dir{"/tmp/filesystemchecks"};
};

/// HostOps backed by the running Linux system, through shell tools and syscalls.
/// With DIRTY_CMD_RUN=1 file, directory and ownership writes are logged instead of performed.
class SystemHost final : public HostOps {
 public:
    explicit SystemHost(tools::PackageManager package_manager, SystemPaths paths = {}) noexcept;

    [[nodiscard]] auto path_exists(std::string_view path) noexcept -> bool override;
    void sleep_for(std::chrono::milliseconds duration) noexcept override;

    auto run(std::string_view command) noexcept -> utils::CommandResult override;
    auto run_checked(std::string_view command) noexcept -> Result<std::string> override;

    auto ensure_installed(std::string_view package) noexcept -> Result<bool> override;
    auto ensure_logical_volume(const LogicalVolumeRequest& request) noexcept -> Result<bool> override;
    auto ensure_backing_file(const BackingFileRequest& request) noexcept -> Result<bool> override;
    auto upsert_fstab_entry(const FstabEntry& entry) noexcept -> Result<bool> override;
    auto mount(const MountRequest& request) noexcept -> Result<> override;
    auto ensure_directory(const DirectoryRequest& request) noexcept -> Result<bool> override;

    [[nodiscard]] auto is_mounted(std::string_view device) noexcept -> bool override;
    [[nodiscard]] auto is_mounted_at(std::string_view device, std::string_view mountpoint) noexcept -> bool override;
    [[nodiscard]] auto is_mount_point(std::string_view path) noexcept -> bool override;
    [[nodiscard]] auto probe_mountable(std::string_view device, std::string_view label) noexcept -> bool override;

    auto set_frozen(std::string_view mountpoint, bool frozen) noexcept -> Result<bool> override;

 private:
    tools::PackageManager m_package_manager;
    SystemPaths m_paths;
};

// Build the lvcreate invocation, size with '%' is given in extents (-l) instead of bytes (-L)
auto make_lvcreate_command(const LogicalVolumeRequest& request) noexcept -> std::string;

// Whether failed fsfreeze output means the filesystem already was frozen (or thawed)
auto fsfreeze_already_in_state(std::string_view output, bool frozen) noexcept -> bool;

// Parse an octal mode such as "755" or "0750"
auto parse_mode(std::string_view mode) noexcept -> std::optional<std::uint32_t>;

}  // namespace fsprov

#endif  // SYSTEM_HOST_HPP
