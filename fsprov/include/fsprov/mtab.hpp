#ifndef MTAB_HPP
#define MTAB_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace fsprov::mtab {

struct MTabEntry {
    std::string device{};
    std::string mountpoint{};
    std::string fstype{};
    std::string options{};

    bool operator==(const MTabEntry&) const = default;
};

// Parse mtab
auto parse_mtab(std::string_view mtab_path = "/proc/self/mounts") noexcept -> std::optional<std::vector<MTabEntry>>;

// Parse mtab content. Octal escapes of the kernel (e.g '\040' for space) are decoded.
auto parse_mtab_content(std::string_view mtab_content) noexcept -> std::vector<MTabEntry>;

// Whether any entry has device as its source
auto has_device(const std::vector<MTabEntry>& entries, std::string_view device) noexcept -> bool;

// Whether an entry mounts device at mountpoint
auto has_device_at(const std::vector<MTabEntry>& entries, std::string_view device, std::string_view mountpoint) noexcept -> bool;

}  // namespace fsprov::mtab

#endif  // MTAB_HPP
