#ifndef STORAGE_HPP
#define STORAGE_HPP

#include "fsprov/error.hpp"
#include "fsprov/host.hpp"
#include "fsprov/report.hpp"
#include "fsprov/spec.hpp"

#include <string_view>  // for string_view

namespace fsprov::storage {

// Whether the FilesystemSpec asks for backing storage to be created: a volume group or file plus a size
[[nodiscard]] constexpr auto wants_backing_storage(const FilesystemSpec& spec) noexcept -> bool {
    return (spec.vg || spec.file) && spec.size.has_value();
}

/// @brief Idempotently create the logical volume or backing file the filesystem lives on.
/// No-op unless wants_backing_storage(spec).
/// @param device The resolved device, the loop device a backing file is attached to.
auto provision_storage(HostOps& host, const FilesystemSpec& spec, std::string_view device) noexcept -> Result<ActionReport>;

}  // namespace fsprov::storage

#endif  // STORAGE_HPP
