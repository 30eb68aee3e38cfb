#ifndef REPORT_HPP
#define REPORT_HPP

#include <optional>  // for optional
#include <string>    // for string
#include <vector>    // for vector

namespace fsprov {

/// Outcome of a successful action.
struct ActionReport {
    // Human readable description of each change made to the host, in order
    std::vector<std::string> changes{};
    // Set when a guard turned the action (or its remainder) into a no-op
    std::optional<std::string> skipped{};

    [[nodiscard]] bool changed() const noexcept { return !changes.empty(); }

    // Record a change
    void add_change(std::string change) noexcept;

    // Record the guard which stopped the action, logging it at info level
    auto skip(std::string reason) noexcept -> ActionReport&;

    // Append changes and skip reason of a sub-step
    void merge(ActionReport&& other) noexcept;
};

}  // namespace fsprov

#endif  // REPORT_HPP
