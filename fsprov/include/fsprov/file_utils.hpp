#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace fsprov::file_utils {

// Reads the file line by line, so it also works on procfs files which report zero size.
// Returns std::nullopt when the file cannot be opened, errno is left as open set it.
auto read_whole_file(std::string_view filepath) noexcept -> std::optional<std::string>;

// If the file doesn't exist, then it create one and write into it.
// If the file exists already, then it will overwrite file content with provided data.
// On open failure errno is left as open set it.
auto create_file_for_overwrite(std::string_view filepath, std::string_view data) noexcept -> bool;

}  // namespace fsprov::file_utils

#endif  // FILE_UTILS_HPP
