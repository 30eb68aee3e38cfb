#include "fsprov/report.hpp"

#include <utility>  // for move

#include <spdlog/spdlog.h>

namespace fsprov {

void ActionReport::add_change(std::string change) noexcept {
    spdlog::info("{}", change);
    changes.emplace_back(std::move(change));
}

auto ActionReport::skip(std::string reason) noexcept -> ActionReport& {
    spdlog::info("skipping: {}", reason);
    skipped = std::move(reason);
    return *this;
}

void ActionReport::merge(ActionReport&& other) noexcept {
    for (auto&& change : other.changes) {
        changes.emplace_back(std::move(change));
    }
    if (other.skipped) {
        skipped = std::move(other.skipped);
    }
}

}  // namespace fsprov
