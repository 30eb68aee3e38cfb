#ifndef PROVIDER_HPP
#define PROVIDER_HPP

#include "fsprov/error.hpp"
#include "fsprov/fs_tools.hpp"
#include "fsprov/host.hpp"
#include "fsprov/report.hpp"
#include "fsprov/spec.hpp"

#include <optional>  // for optional
#include <string>    // for string

namespace fsprov {

/// Converges one filesystem towards its FilesystemSpec.
///
/// Every call to run() performs one action. The device path is resolved once
/// per action and reused for its whole duration, since the action's own side
/// effects (e.g attaching a loop device) may change what resolution would observe.
class Provider final {
 public:
    Provider(HostOps& host, tools::FsTools tools, FilesystemSpec spec) noexcept;

    /// Run one action. Fatal conditions are returned as Error, guarded no-ops
    /// are reported through ActionReport::skipped.
    auto run(Action action) noexcept -> Result<ActionReport>;

    [[nodiscard]] auto spec() const noexcept -> const FilesystemSpec& { return m_spec; }

 private:
    auto device() noexcept -> const std::string&;

    auto action_create() noexcept -> Result<ActionReport>;
    auto action_enable() noexcept -> Result<ActionReport>;
    auto action_mount() noexcept -> Result<ActionReport>;

    HostOps& m_host;
    tools::FsTools m_tools;
    FilesystemSpec m_spec;
    std::optional<std::string> m_device{};
};

}  // namespace fsprov

#endif  // PROVIDER_HPP
