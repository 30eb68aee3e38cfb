#include "fsprov/string_utils.hpp"

namespace fsprov::utils {

auto split_list(std::string_view str, char delim) noexcept -> std::vector<std::string> {
    return utils::make_split_view(str, delim)
        | std::ranges::views::transform([](std::string_view sv) { return utils::trim(sv); })
        | std::ranges::views::filter([](std::string_view sv) { return !sv.empty(); })
        | std::ranges::views::transform([](std::string_view sv) { return std::string{sv}; })
        | std::ranges::to<std::vector<std::string>>();
}

auto join(const std::vector<std::string>& lines, std::string_view delim) noexcept -> std::string {
    return lines | std::ranges::views::join_with(delim) | std::ranges::to<std::string>();
}

auto split_fields(std::string_view line) noexcept -> std::vector<std::string_view> {
    std::vector<std::string_view> fields{};
    std::size_t pos{};
    while (pos < line.size()) {
        const auto begin = line.find_first_not_of(" \t", pos);
        if (begin == std::string_view::npos) {
            break;
        }
        auto end = line.find_first_of(" \t", begin);
        if (end == std::string_view::npos) {
            end = line.size();
        }
        fields.emplace_back(line.substr(begin, end - begin));
        pos = end;
    }
    return fields;
}

}  // namespace fsprov::utils
