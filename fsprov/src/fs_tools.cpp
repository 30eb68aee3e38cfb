#include "fsprov/fs_tools.hpp"
#include "fsprov/string_utils.hpp"

#include <algorithm>  // for find
#include <utility>    // for move

#include <spdlog/spdlog.h>

#define TOML_EXCEPTIONS 0  // disable exceptions
#include <toml++/toml.h>

using namespace std::string_view_literals;

namespace {

// NOLINTNEXTLINE
static constexpr auto DEFAULT_FS_TOOLS = R"(
network_fstypes = ["nfs", "nfs4", "cifs", "smp", "nbd"]

[package_manager]
query = "pacman -Q {}"
install = "pacman -S --noconfirm --needed {}"

[fstypes.ext2]
package = "e2fsprogs"
forceopt = "-F"
[fstypes.ext3]
package = "e2fsprogs"
forceopt = "-F"
[fstypes.ext4]
package = "e2fsprogs"
forceopt = "-F"
[fstypes.xfs]
package = "xfsprogs"
forceopt = "-f"
[fstypes.btrfs]
package = "btrfs-progs"
forceopt = "-f"
[fstypes.f2fs]
package = "f2fs-tools"
forceopt = "-f"
[fstypes.vfat]
package = "dosfstools"
)"sv;

inline void parse_toml_array(const toml::array* arr, std::vector<std::string>& vec) noexcept {
    for (const auto& node_el : *arr) {
        if (auto elem = node_el.value<std::string_view>()) {
            vec.emplace_back(*elem);
        }
    }
}

void apply_tools_table(const toml::table& tools_table, fsprov::tools::FsTools& tools) noexcept {
    if (const auto* network_arr = tools_table["network_fstypes"].as_array()) {
        tools.network_fstypes.clear();
        parse_toml_array(network_arr, tools.network_fstypes);
    }

    if (auto query = tools_table["package_manager"]["query"].value<std::string_view>()) {
        tools.package_manager.query = *query;
    }
    if (auto install = tools_table["package_manager"]["install"].value<std::string_view>()) {
        tools.package_manager.install = *install;
    }

    const auto* fstypes_table = tools_table["fstypes"].as_table();
    if (fstypes_table == nullptr) {
        return;
    }
    for (auto&& [key, value] : *fstypes_table) {
        const auto* value_table = value.as_table();
        if (value_table == nullptr) {
            spdlog::warn("fs tools: ignoring non-table entry '{}'", std::string_view{key});
            continue;
        }

        // package is a comma separated list, same format as FilesystemSpec::package
        fsprov::tools::FsToolEntry entry{};
        if (auto package = (*value_table)["package"].value<std::string_view>()) {
            entry.packages = fsprov::utils::split_list(*package);
        }
        if (auto forceopt = (*value_table)["forceopt"].value<std::string_view>()) {
            entry.forceopt = *forceopt;
        }
        tools.fstypes.insert_or_assign(std::string{std::string_view{key}}, std::move(entry));
    }
}

}  // namespace

namespace fsprov::tools {

auto FsTools::is_network_fs(std::string_view fstype) const noexcept -> bool {
    return std::ranges::find(network_fstypes, fstype) != network_fstypes.end();
}

auto FsTools::find(std::string_view fstype) const noexcept -> const FsToolEntry* {
    const auto it = fstypes.find(fstype);
    return it != fstypes.end() ? &it->second : nullptr;
}

auto default_fs_tools() noexcept -> FsTools {
    FsTools tools{};
    toml::parse_result defaults = toml::parse(DEFAULT_FS_TOOLS);
    if (defaults.failed()) {
        spdlog::error("Failed to parse built-in fs tools: {}", defaults.error().description());
        return tools;
    }
    apply_tools_table(defaults.table(), tools);
    return tools;
}

auto parse_fs_tools(std::string_view config_content) noexcept -> std::optional<FsTools> {
    toml::parse_result tools_conf = toml::parse(config_content);
    if (tools_conf.failed()) {
        spdlog::error("Failed to parse fs tools: {}", tools_conf.error().description());
        return std::nullopt;
    }

    auto tools = default_fs_tools();
    apply_tools_table(tools_conf.table(), tools);
    return std::make_optional<FsTools>(std::move(tools));
}

}  // namespace fsprov::tools
