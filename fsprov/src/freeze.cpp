#include "fsprov/freeze.hpp"

#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>

namespace {

auto toggle_freeze(fsprov::HostOps& host, const fsprov::FilesystemSpec& spec, bool frozen) noexcept -> fsprov::Result<fsprov::ActionReport> {
    using namespace fsprov;

    if (!spec.mount) {
        return make_error(ErrorKind::Configuration, "mount not specified");
    }
    const auto& mountpoint = *spec.mount;

    auto changed = host.set_frozen(mountpoint, frozen);
    if (!changed) {
        return std::unexpected(std::move(changed.error()));
    }

    ActionReport report{};
    if (!*changed) {
        report.skip(fmt::format(FMT_COMPILE("{} is already {}"), mountpoint, frozen ? "frozen" : "unfrozen"));
        return report;
    }
    report.add_change(fmt::format(FMT_COMPILE("{} {}"), frozen ? "Freeze" : "Unfreeze", mountpoint));
    return report;
}

}  // namespace

namespace fsprov::freeze {

auto freeze_filesystem(HostOps& host, const FilesystemSpec& spec) noexcept -> Result<ActionReport> {
    return toggle_freeze(host, spec, true);
}

auto unfreeze_filesystem(HostOps& host, const FilesystemSpec& spec) noexcept -> Result<ActionReport> {
    return toggle_freeze(host, spec, false);
}

}  // namespace fsprov::freeze
