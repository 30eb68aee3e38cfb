#include "fsprov/spec.hpp"

using namespace std::string_view_literals;

namespace fsprov {

auto action_from_string(std::string_view action_str) noexcept -> std::optional<Action> {
    if (action_str == "create"sv) {
        return Action::Create;
    }
    if (action_str == "enable"sv) {
        return Action::Enable;
    }
    if (action_str == "mount"sv) {
        return Action::Mount;
    }
    if (action_str == "freeze"sv) {
        return Action::Freeze;
    }
    if (action_str == "unfreeze"sv) {
        return Action::Unfreeze;
    }
    return std::nullopt;
}

auto action_to_string(Action action) noexcept -> std::string_view {
    switch (action) {
    case Action::Create:
        return "create"sv;
    case Action::Enable:
        return "enable"sv;
    case Action::Mount:
        return "mount"sv;
    case Action::Freeze:
        return "freeze"sv;
    case Action::Unfreeze:
        return "unfreeze"sv;
    }
    return "unknown"sv;
}

auto fsck_pass_from_int(std::int32_t value) noexcept -> std::optional<FsckPass> {
    if (value < 0 || value > 2) {
        return std::nullopt;
    }
    return static_cast<FsckPass>(value);
}

auto dump_frequency_from_int(std::int32_t value) noexcept -> std::optional<DumpFrequency> {
    if (value < 0 || value > 2) {
        return std::nullopt;
    }
    return static_cast<DumpFrequency>(value);
}

}  // namespace fsprov
