#include "fsprov/mkfs.hpp"
#include "fsprov/string_utils.hpp"

#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace fsprov::mkfs {

auto required_packages(const tools::FsTools& tools, const FilesystemSpec& spec) noexcept -> std::vector<std::string> {
    std::vector<std::string> packages{};
    if (const auto* fs_tools = tools.find(spec.fstype)) {
        packages = fs_tools->packages;
    }
    if (spec.package) {
        for (auto&& keyed_package : utils::split_list(*spec.package)) {
            packages.emplace_back(std::move(keyed_package));
        }
    }
    return packages;
}

auto build_mkfs_command(const tools::FsTools& tools, const FilesystemSpec& spec, std::string_view device) noexcept -> std::string {
    std::string fstype_arg{spec.fstype};

    const auto* fs_tools = tools.find(spec.fstype);
    if (spec.force && fs_tools != nullptr && !fs_tools->forceopt.empty()) {
        fstype_arg += fmt::format(FMT_COMPILE(" {}"), fs_tools->forceopt);
    }

    // the options slot is always kept, empty options leave a double space before -L
    return fmt::format(FMT_COMPILE("mkfs -t {} {} -L {} {}"), fstype_arg, utils::trim(spec.mkfs_options), spec.effective_label(), device);
}

auto format_device(HostOps& host, const tools::FsTools& tools, const FilesystemSpec& spec, std::string_view device) noexcept -> Result<ActionReport> {
    ActionReport report{};
    const auto& label = spec.effective_label();

    // We only try and create a filesystem if the device exists and is unmounted
    if (host.is_mounted(device)) {
        report.skip(fmt::format(FMT_COMPILE("{} is mounted, not creating a filesystem on it"), device));
        return report;
    }

    for (const auto& package : required_packages(tools, spec)) {
        auto installed = host.ensure_installed(package);
        if (!installed) {
            return std::unexpected(std::move(installed.error()));
        }
        if (*installed) {
            report.add_change(fmt::format(FMT_COMPILE("installed package {}"), package));
        }
    }

    if (!spec.force) {
        const auto& which_cmd = fmt::format(FMT_COMPILE("which mkfs.{}"), spec.fstype);
        if (!host.run(which_cmd).success()) {
            report.skip(fmt::format(FMT_COMPILE("mkfs.{} is not installed"), spec.fstype));
            return report;
        }
    }

    if (!spec.ignore_existing && host.probe_mountable(device, label)) {
        report.skip(fmt::format(FMT_COMPILE("{} already holds a mountable filesystem"), device));
        return report;
    }

    spdlog::info("filesystem {} creating {} on {}", label, spec.fstype, device);
    const auto& mkfs_cmd = build_mkfs_command(tools, spec, device);
    if (auto mkfs_result = host.run_checked(mkfs_cmd); !mkfs_result) {
        return std::unexpected(std::move(mkfs_result.error()));
    }
    report.add_change(fmt::format(FMT_COMPILE("Mkfs type {} {} {}"), spec.fstype, label, device));
    return report;
}

}  // namespace fsprov::mkfs
