#ifndef SPEC_HPP
#define SPEC_HPP

#include <cstdint>      // for int32_t, uint8_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace fsprov {

/// Actions a filesystem resource can be converged with.
enum class Action : std::uint8_t {
    Create,
    Enable,
    Mount,
    Freeze,
    Unfreeze
};

/// fsck pass number of the fstab entry.
enum class FsckPass : std::uint8_t {
    Never  = 0,
    Root   = 1,
    Others = 2,
};

/// dump frequency of the fstab entry.
enum class DumpFrequency : std::uint8_t {
    Never  = 0,
    Daily  = 1,
    Weekly = 2,
};

[[nodiscard]] auto action_from_string(std::string_view action_str) noexcept -> std::optional<Action>;
[[nodiscard]] auto action_to_string(Action action) noexcept -> std::string_view;

[[nodiscard]] auto fsck_pass_from_int(std::int32_t value) noexcept -> std::optional<FsckPass>;
[[nodiscard]] auto dump_frequency_from_int(std::int32_t value) noexcept -> std::optional<DumpFrequency>;

/// Desired state of one filesystem.
struct FilesystemSpec {
    // Resource identity, the label falls back to it
    std::string name{};
    std::optional<std::string> label{};

    // Device sources, see resolve_device for precedence
    std::optional<std::string> device{};
    std::optional<std::string> vg{};
    std::optional<std::string> file{};
    std::optional<std::string> uuid{};

    // Creation options
    std::string fstype{"ext3"};
    std::string mkfs_options{};
    std::optional<std::string> package{};

    // LVM and file-backed storage
    bool sparse{true};
    std::optional<std::string> size{};
    std::optional<std::int32_t> stripes{};
    std::optional<std::int32_t> mirrors{};

    // Mounting options
    std::optional<std::string> mount{};
    std::string options{"defaults"};
    std::optional<std::string> user{};
    std::optional<std::string> group{};
    std::optional<std::string> mode{};

    // fstab fields
    FsckPass pass{FsckPass::Never};
    DumpFrequency dump{DumpFrequency::Never};

    // Destructive switches: force passes the force flag to mkfs,
    // ignore_existing formats even over a mountable filesystem.
    bool force{false};
    bool ignore_existing{false};

    // Skip the action while the device is absent (storage appearing later in the run)
    bool device_defer{false};

    /// Label of the filesystem, the resource name unless set explicitly.
    [[nodiscard]] auto effective_label() const noexcept -> const std::string& {
        return label ? *label : name;
    }

    bool operator==(const FilesystemSpec&) const = default;
};

}  // namespace fsprov

#endif  // SPEC_HPP
