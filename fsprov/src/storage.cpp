#include "fsprov/storage.hpp"

#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>

namespace fsprov::storage {

auto provision_storage(HostOps& host, const FilesystemSpec& spec, std::string_view device) noexcept -> Result<ActionReport> {
    ActionReport report{};
    if (!wants_backing_storage(spec)) {
        return report;
    }

    const auto& label = spec.effective_label();
    if (spec.vg) {
        const LogicalVolumeRequest request{
            .name    = label,
            .group   = *spec.vg,
            .size    = *spec.size,
            .stripes = spec.stripes,
            .mirrors = spec.mirrors,
        };
        auto created = host.ensure_logical_volume(request);
        if (!created) {
            return std::unexpected(std::move(created.error()));
        }
        if (*created) {
            report.add_change(fmt::format(FMT_COMPILE("created logical volume {} in {} ({})"), label, *spec.vg, *spec.size));
        }
    }

    if (spec.file) {
        const BackingFileRequest request{
            .path   = *spec.file,
            .device = std::string{device},
            .size   = *spec.size,
            .sparse = spec.sparse,
        };
        auto created = host.ensure_backing_file(request);
        if (!created) {
            return std::unexpected(std::move(created.error()));
        }
        if (*created) {
            report.add_change(fmt::format(FMT_COMPILE("created backing file {} ({}, sparse={}) for {}"), *spec.file, *spec.size, spec.sparse, device));
        }
    }
    return report;
}

}  // namespace fsprov::storage
