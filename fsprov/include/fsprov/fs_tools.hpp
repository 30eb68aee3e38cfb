#ifndef FS_TOOLS_HPP
#define FS_TOOLS_HPP

#include <map>          // for map
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace fsprov::tools {

/// Tooling needed to create one filesystem type.
struct FsToolEntry {
    std::vector<std::string> packages{};
    // mkfs flag which overrides mkfs's own safety checks, e.g "-F" for ext4
    std::string forceopt{};

    bool operator==(const FsToolEntry&) const = default;
};

/// Commands used to query and install packages. '{}' is replaced by the package name.
struct PackageManager {
    std::string query{"pacman -Q {}"};
    std::string install{"pacman -S --noconfirm --needed {}"};

    bool operator==(const PackageManager&) const = default;
};

struct FsTools {
    std::map<std::string, FsToolEntry, std::less<>> fstypes{};
    std::vector<std::string> network_fstypes{};
    PackageManager package_manager{};

    // Filesystems mounted by protocol rather than from a local device node
    [[nodiscard]] auto is_network_fs(std::string_view fstype) const noexcept -> bool;

    [[nodiscard]] auto find(std::string_view fstype) const noexcept -> const FsToolEntry*;
};

// Built-in tool table
auto default_fs_tools() noexcept -> FsTools;

// Parse tool table, overriding the built-in defaults with what config_content defines
auto parse_fs_tools(std::string_view config_content) noexcept -> std::optional<FsTools>;

}  // namespace fsprov::tools

#endif  // FS_TOOLS_HPP
