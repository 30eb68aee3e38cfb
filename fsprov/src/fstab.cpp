#include "fsprov/fstab.hpp"
#include "fsprov/device.hpp"
#include "fsprov/mount.hpp"
#include "fsprov/string_utils.hpp"

#include <cstdint>  // for int32_t
#include <utility>  // for move
#include <vector>   // for vector

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

// fstab(5) fields cannot hold blanks, they are written as octal escapes
auto escape_field(std::string_view field) noexcept -> std::string {
    std::string result{};
    result.reserve(field.size());
    for (const char c : field) {
        if (c == ' ') {
            result += "\\040"sv;
        } else if (c == '\t') {
            result += "\\011"sv;
        } else {
            result += c;
        }
    }
    return result;
}

constexpr auto to_int(fsprov::FsckPass pass) noexcept -> std::int32_t {
    return static_cast<std::int32_t>(pass);
}

constexpr auto to_int(fsprov::DumpFrequency dump) noexcept -> std::int32_t {
    return static_cast<std::int32_t>(dump);
}

// Whether line is a live entry for mountpoint
auto line_matches_mountpoint(std::string_view line, std::string_view escaped_mountpoint) noexcept -> bool {
    const auto trimmed = fsprov::utils::trim(line);
    if (trimmed.empty() || trimmed.starts_with('#')) {
        return false;
    }
    const auto& fields = fsprov::utils::split_fields(trimmed);
    return fields.size() >= 2 && fields[1] == escaped_mountpoint;
}

}  // namespace

namespace fsprov::fs {

auto make_fstab_entry(const FilesystemSpec& spec, std::string_view device) noexcept -> FstabEntry {
    FstabEntry entry{
        .mountpoint = spec.mount.value_or(""),
        .device     = std::string{device},
        .fstype     = spec.fstype,
        .options    = spec.options,
        .dump       = spec.dump,
        .pass       = spec.pass,
    };

    // Substitute the device with the file when in loopback mode.
    if (spec.file && device.starts_with("/dev/loop"sv)) {
        entry.device  = *spec.file;
        entry.options = entry.options.empty() ? fmt::format(FMT_COMPILE("loop={}"), device)
                                              : fmt::format(FMT_COMPILE("{},loop={}"), entry.options, device);
    }
    return entry;
}

auto format_fstab_entry(const FstabEntry& entry) noexcept -> std::string {
    const auto& options = entry.options.empty() ? std::string{"defaults"} : entry.options;
    return fmt::format(FMT_COMPILE("{:41} {:<14} {:<7} {:<10} {} {}"), escape_field(entry.device),
        escape_field(entry.mountpoint), entry.fstype, options, to_int(entry.dump), to_int(entry.pass));
}

auto upsert_fstab_content(std::string_view fstab_content, const FstabEntry& entry) noexcept -> FstabUpdate {
    const auto& escaped_mountpoint = escape_field(entry.mountpoint);
    const auto& new_line           = format_fstab_entry(entry);
    const auto& new_fields         = utils::split_fields(new_line);

    std::vector<std::string> lines{};
    bool found{false};
    bool changed{false};

    // keep empty lines, split view would drop them
    std::size_t pos{};
    while (pos < fstab_content.size()) {
        auto end = fstab_content.find('\n', pos);
        if (end == std::string_view::npos) {
            end = fstab_content.size();
        }
        const auto line = fstab_content.substr(pos, end - pos);
        pos             = end + 1;

        if (!line_matches_mountpoint(line, escaped_mountpoint)) {
            lines.emplace_back(line);
            continue;
        }
        if (found) {
            // duplicate entry for the same mount point
            changed = true;
            continue;
        }
        found = true;
        if (utils::split_fields(utils::trim(line)) == new_fields) {
            lines.emplace_back(line);
        } else {
            lines.emplace_back(new_line);
            changed = true;
        }
    }

    if (!found) {
        lines.emplace_back(new_line);
        changed = true;
    }

    auto content = utils::join(lines, "\n");
    content += '\n';
    return FstabUpdate{.content = std::move(content), .changed = changed};
}

auto enable_mount(HostOps& host, const tools::FsTools& tools, const FilesystemSpec& spec, std::string_view device) noexcept -> Result<ActionReport> {
    ActionReport report{};
    if (!spec.mount) {
        report.skip("no mount point configured");
        return report;
    }

    auto mount_point = mount::ensure_mount_point(host, *spec.mount);
    if (!mount_point) {
        return std::unexpected(std::move(mount_point.error()));
    }
    report.merge(std::move(*mount_point));

    if (device::is_deferred(host, tools, spec, device)) {
        report.skip(fmt::format(FMT_COMPILE("device {} does not exist yet, deferring fstab entry"), device));
        return report;
    }

    const auto& entry = make_fstab_entry(spec, device);
    auto updated      = host.upsert_fstab_entry(entry);
    if (!updated) {
        return std::unexpected(std::move(updated.error()));
    }
    if (*updated) {
        report.add_change(fmt::format(FMT_COMPILE("enabled {} in fstab: {}"), *spec.mount, format_fstab_entry(entry)));
    }
    return report;
}

}  // namespace fsprov::fs
