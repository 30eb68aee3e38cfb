#ifndef SPEC_CONFIG_HPP
#define SPEC_CONFIG_HPP

#include "fsprov/spec.hpp"

#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view

namespace cli {

/// Parses a filesystem spec from JSON string content.
/// @param json_content The JSON document, an object keyed by FilesystemSpec field names.
/// @return FilesystemSpec on success, or error string on failure.
[[nodiscard]] auto parse_spec_config(std::string_view json_content) noexcept
    -> std::expected<fsprov::FilesystemSpec, std::string>;

/// Reads and parses a filesystem spec from file.
[[nodiscard]] auto load_spec_config(std::string_view filepath) noexcept
    -> std::expected<fsprov::FilesystemSpec, std::string>;

}  // namespace cli

#endif  // SPEC_CONFIG_HPP
