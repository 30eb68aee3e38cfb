#ifndef HOST_HPP
#define HOST_HPP

#include "fsprov/error.hpp"
#include "fsprov/io_utils.hpp"
#include "fsprov/spec.hpp"

#include <chrono>       // for milliseconds
#include <cstdint>      // for int32_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace fsprov {

struct LogicalVolumeRequest {
    std::string name{};
    std::string group{};
    std::string size{};
    std::optional<std::int32_t> stripes{};
    std::optional<std::int32_t> mirrors{};

    bool operator==(const LogicalVolumeRequest&) const = default;
};

struct BackingFileRequest {
    std::string path{};
    // loop device to attach the file to, may be empty
    std::string device{};
    std::string size{};
    bool sparse{true};

    bool operator==(const BackingFileRequest&) const = default;
};

struct FstabEntry {
    std::string mountpoint{};
    std::string device{};
    std::string fstype{};
    std::string options{};
    DumpFrequency dump{DumpFrequency::Never};
    FsckPass pass{FsckPass::Never};

    bool operator==(const FstabEntry&) const = default;
};

struct MountRequest {
    std::string device{};
    std::string mountpoint{};
    std::string fstype{};
    std::string options{};

    bool operator==(const MountRequest&) const = default;
};

struct DirectoryRequest {
    std::string path{};
    std::optional<std::string> owner{};
    std::optional<std::string> group{};
    std::optional<std::string> mode{};
    bool recursive{true};

    bool operator==(const DirectoryRequest&) const = default;
};

/// Everything the convergence logic needs from the machine.
///
/// Queries never change host state, with the documented exception of probe_mountable.
/// The ensure_* operations are idempotent and return whether they changed anything.
class HostOps {
 public:
    virtual ~HostOps() = default;

    [[nodiscard]] virtual auto path_exists(std::string_view path) noexcept -> bool = 0;
    virtual void sleep_for(std::chrono::milliseconds duration) noexcept         = 0;

    /// Runs a shell command, never fails on non-zero exit status.
    virtual auto run(std::string_view command) noexcept -> utils::CommandResult = 0;
    /// Runs a shell command, non-zero exit status is an ExternalCommand error.
    virtual auto run_checked(std::string_view command) noexcept -> Result<std::string> = 0;

    virtual auto ensure_installed(std::string_view package) noexcept -> Result<bool>                     = 0;
    virtual auto ensure_logical_volume(const LogicalVolumeRequest& request) noexcept -> Result<bool>    = 0;
    virtual auto ensure_backing_file(const BackingFileRequest& request) noexcept -> Result<bool>        = 0;
    virtual auto upsert_fstab_entry(const FstabEntry& entry) noexcept -> Result<bool>                   = 0;
    virtual auto mount(const MountRequest& request) noexcept -> Result<>                                = 0;
    virtual auto ensure_directory(const DirectoryRequest& request) noexcept -> Result<bool>             = 0;

    /// Whether device is mounted anywhere.
    [[nodiscard]] virtual auto is_mounted(std::string_view device) noexcept -> bool = 0;
    /// Whether device is mounted at mountpoint.
    [[nodiscard]] virtual auto is_mounted_at(std::string_view device, std::string_view mountpoint) noexcept -> bool = 0;
    [[nodiscard]] virtual auto is_mount_point(std::string_view path) noexcept -> bool = 0;

    /// Whether device holds a filesystem the kernel can mount.
    /// Side effect: creates a scratch directory named after label and mounts/unmounts the device there.
    [[nodiscard]] virtual auto probe_mountable(std::string_view device, std::string_view label) noexcept -> bool = 0;

    /// Freeze or thaw the filesystem mounted at mountpoint.
    /// The kernel keeps the frozen state, false means it already was in the requested state.
    virtual auto set_frozen(std::string_view mountpoint, bool frozen) noexcept -> Result<bool> = 0;
};

}  // namespace fsprov

#endif  // HOST_HPP
