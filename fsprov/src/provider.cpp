#include "fsprov/provider.hpp"
#include "fsprov/device.hpp"
#include "fsprov/freeze.hpp"
#include "fsprov/fstab.hpp"
#include "fsprov/mkfs.hpp"
#include "fsprov/mount.hpp"
#include "fsprov/storage.hpp"

#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace fsprov {

Provider::Provider(HostOps& host, tools::FsTools tools, FilesystemSpec spec) noexcept
  : m_host(host), m_tools(std::move(tools)), m_spec(std::move(spec)) { }

auto Provider::device() noexcept -> const std::string& {
    if (!m_device) {
        m_device = device::resolve_device(m_spec);
    }
    return *m_device;
}

auto Provider::run(Action action) noexcept -> Result<ActionReport> {
    // resolve afresh for each action
    m_device.reset();
    spdlog::debug("filesystem {}: running action {} on {}", m_spec.effective_label(), action_to_string(action), device());

    switch (action) {
    case Action::Create:
        return action_create();
    case Action::Enable:
        return action_enable();
    case Action::Mount:
        return action_mount();
    case Action::Freeze:
        return freeze::freeze_filesystem(m_host, m_spec);
    case Action::Unfreeze:
        return freeze::unfreeze_filesystem(m_host, m_spec);
    }
    return make_error(ErrorKind::Configuration, "unknown action");
}

auto Provider::action_create() noexcept -> Result<ActionReport> {
    ActionReport report{};
    const auto& dev = device();
    if (m_spec.file && dev.empty()) {
        return make_error(ErrorKind::Configuration, "file-backed filesystem needs the loop device to attach to in 'device'");
    }

    // In two cases we may need to idempotently create the storage before creating the filesystem on it: LVM and file-backed.
    if (storage::wants_backing_storage(m_spec)) {
        auto provisioned = storage::provision_storage(m_host, m_spec, dev);
        if (!provisioned) {
            return std::unexpected(std::move(provisioned.error()));
        }
        report.merge(std::move(*provisioned));
    } else if (device::is_deferred(m_host, m_tools, m_spec, dev)) {
        report.skip(fmt::format(FMT_COMPILE("device {} does not exist yet, deferring filesystem creation"), dev));
        return report;
    }

    if (!m_tools.is_network_fs(m_spec.fstype) && !m_host.path_exists(dev)) {
        if (auto waited = device::wait_for_device(m_host, dev); !waited) {
            return std::unexpected(std::move(waited.error()));
        }
    }

    auto formatted = mkfs::format_device(m_host, m_tools, m_spec, dev);
    if (!formatted) {
        return std::unexpected(std::move(formatted.error()));
    }
    report.merge(std::move(*formatted));
    return report;
}

auto Provider::action_enable() noexcept -> Result<ActionReport> {
    return fs::enable_mount(m_host, m_tools, m_spec, device());
}

auto Provider::action_mount() noexcept -> Result<ActionReport> {
    return mount::mount_filesystem(m_host, m_tools, m_spec, device());
}

}  // namespace fsprov
