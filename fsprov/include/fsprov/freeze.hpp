#ifndef FREEZE_HPP
#define FREEZE_HPP

#include "fsprov/error.hpp"
#include "fsprov/host.hpp"
#include "fsprov/report.hpp"
#include "fsprov/spec.hpp"

namespace fsprov::freeze {

// Suspend writes to the mounted filesystem, no-op if it is frozen already
auto freeze_filesystem(HostOps& host, const FilesystemSpec& spec) noexcept -> Result<ActionReport>;

// Resume writes to the mounted filesystem, no-op unless it is frozen
auto unfreeze_filesystem(HostOps& host, const FilesystemSpec& spec) noexcept -> Result<ActionReport>;

}  // namespace fsprov::freeze

#endif  // FREEZE_HPP
