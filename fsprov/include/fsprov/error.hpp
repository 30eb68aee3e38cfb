#ifndef ERROR_HPP
#define ERROR_HPP

#include <cstdint>      // for uint8_t
#include <expected>     // for expected, unexpected
#include <string>       // for string
#include <string_view>  // for string_view

namespace fsprov {

/// Fatal failure classes. Each aborts the current action without rolling back earlier side effects.
enum class ErrorKind : std::uint8_t {
    /// A field required by the requested action is missing.
    Configuration,
    /// A device node never appeared.
    Timeout,
    /// An external command exited with non-zero status.
    ExternalCommand,
};

struct Error {
    ErrorKind kind{ErrorKind::Configuration};
    std::string message{};
};

template <typename T = void>
using Result = std::expected<T, Error>;

[[nodiscard]] auto error_kind_to_string(ErrorKind kind) noexcept -> std::string_view;

[[nodiscard]] auto make_error(ErrorKind kind, std::string message) noexcept -> std::unexpected<Error>;

}  // namespace fsprov

#endif  // ERROR_HPP
