#include "fsprov/mtab.hpp"
#include "fsprov/file_utils.hpp"
#include "fsprov/string_utils.hpp"

#include <algorithm>  // for any_of

using namespace std::string_view_literals;

namespace {

constexpr auto is_octal_digit(char c) noexcept -> bool {
    return c >= '0' && c <= '7';
}

auto unescape_field(std::string_view field) noexcept -> std::string {
    std::string result{};
    result.reserve(field.size());
    for (std::size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size() && is_octal_digit(field[i + 1])
            && is_octal_digit(field[i + 2]) && is_octal_digit(field[i + 3])) {
            const auto value = ((field[i + 1] - '0') << 6) | ((field[i + 2] - '0') << 3) | (field[i + 3] - '0');
            result += static_cast<char>(value);
            i += 3;
            continue;
        }
        result += field[i];
    }
    return result;
}

}  // namespace

namespace fsprov::mtab {

auto parse_mtab_content(std::string_view mtab_content) noexcept -> std::vector<MTabEntry> {
    std::vector<MTabEntry> entries{};

    for (auto&& line : utils::make_split_view(mtab_content)) {
        const auto trimmed = utils::trim(line);
        if (trimmed.empty() || trimmed.starts_with('#')) {
            continue;
        }

        // e.g format: <device> <mountpoint> <fstype> <options> <dump> <pass>
        const auto& fields = utils::split_fields(trimmed);
        if (fields.size() < 3) {
            continue;
        }
        entries.emplace_back(MTabEntry{
            .device     = unescape_field(fields[0]),
            .mountpoint = unescape_field(fields[1]),
            .fstype     = std::string{fields[2]},
            .options    = fields.size() > 3 ? std::string{fields[3]} : std::string{},
        });
    }
    return entries;
}

auto parse_mtab(std::string_view mtab_path) noexcept -> std::optional<std::vector<MTabEntry>> {
    if (mtab_path.empty()) {
        return std::nullopt;
    }

    // mounts file size is reported as zero bytes, read_whole_file reads line by line
    auto&& file_content = file_utils::read_whole_file(mtab_path);
    if (!file_content) {
        return std::nullopt;
    }
    return mtab::parse_mtab_content(*file_content);
}

auto has_device(const std::vector<MTabEntry>& entries, std::string_view device) noexcept -> bool {
    return std::ranges::any_of(entries, [device](auto&& entry) { return entry.device == device; });
}

auto has_device_at(const std::vector<MTabEntry>& entries, std::string_view device, std::string_view mountpoint) noexcept -> bool {
    return std::ranges::any_of(entries, [device, mountpoint](auto&& entry) {
        return entry.device == device && entry.mountpoint == mountpoint;
    });
}

}  // namespace fsprov::mtab
