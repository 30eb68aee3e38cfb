#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <algorithm>    // for transform
#include <ranges>       // for ranges::*
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace fsprov::utils {

/// @brief Split a comma separated list, trimming every item and dropping empty ones.
/// @param str The list to split, e.g "xfsprogs, xfsdump".
/// @return The items as owning strings.
auto split_list(std::string_view str, char delim = ',') noexcept -> std::vector<std::string>;

/// @brief Join a vector of strings into a single string using a delimiter.
/// @param lines The lines to join.
/// @param delim The delimiter to join the lines.
/// @return The joined lines as a single string.
auto join(const std::vector<std::string>& lines, std::string_view delim = "\n") noexcept -> std::string;

/// @brief Make a split view from a string into multiple lines based on a delimiter.
/// @param str The string to split.
/// @param delim The delimiter to split the string.
/// @return A range view representing the split lines.
constexpr auto make_split_view(std::string_view str, char delim = '\n') noexcept {
    constexpr auto functor = [](auto&& rng) {
        return std::string_view(&*rng.begin(), static_cast<size_t>(std::ranges::distance(rng)));
    };
    constexpr auto second = [](auto&& rng) { return rng != ""; };

    return str
        | std::ranges::views::split(delim)
        | std::ranges::views::transform(functor)
        | std::ranges::views::filter(second);
}

// Split on any run of blanks (space or tab), as in fstab and /proc/mounts
auto split_fields(std::string_view line) noexcept -> std::vector<std::string_view>;

constexpr auto ltrim(std::string_view str) noexcept -> std::string_view {
    constexpr std::string_view trim_chars{" \t\n\r\v\f"};
    const auto pos = str.find_first_not_of(trim_chars);
    return pos == std::string_view::npos ? std::string_view{} : str.substr(pos);
}

constexpr auto rtrim(std::string_view str) noexcept -> std::string_view {
    constexpr std::string_view trim_chars{" \t\n\r\v\f"};
    const auto pos = str.find_last_not_of(trim_chars);
    return pos == std::string_view::npos ? std::string_view{} : str.substr(0, pos + 1);
}

constexpr auto trim(std::string_view str) noexcept -> std::string_view {
    return ltrim(rtrim(str));
}

}  // namespace fsprov::utils

#endif  // STRING_UTILS_HPP
