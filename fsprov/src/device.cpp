#include "fsprov/device.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace fsprov::device {

auto resolve_device(const FilesystemSpec& spec) noexcept -> std::string {
    const auto& label = spec.effective_label();
    if (spec.file) {
        // the file is attached to a loop device chosen by the caller
        return spec.device.value_or("");
    } else if (spec.vg) {
        return fmt::format(FMT_COMPILE("/dev/mapper/{}-{}"), *spec.vg, label);
    } else if (spec.uuid) {
        return fmt::format(FMT_COMPILE("/dev/disk/by-uuid/{}"), *spec.uuid);
    } else if (spec.device) {
        return *spec.device;
    }
    return fmt::format(FMT_COMPILE("/dev/mapper/{}"), label);
}

auto wait_for_device(HostOps& host, std::string_view device) noexcept -> Result<> {
    std::int32_t count{};
    while (!host.path_exists(device)) {
        ++count;
        host.sleep_for(kDeviceWaitInterval);
        spdlog::debug("waiting for {} to exist, try # {}", device, count);
        if (count >= kDeviceWaitAttempts) {
            return make_error(ErrorKind::Timeout, fmt::format(FMT_COMPILE("Timeout waiting for device {}"), device));
        }
    }
    return {};
}

auto is_deferred(HostOps& host, const tools::FsTools& tools, const FilesystemSpec& spec, std::string_view device) noexcept -> bool {
    return spec.device_defer && !host.path_exists(device) && !tools.is_network_fs(spec.fstype);
}

}  // namespace fsprov::device
