#include "fsprov/error.hpp"

#include <utility>  // for move

using namespace std::string_view_literals;

namespace fsprov {

auto error_kind_to_string(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
    case ErrorKind::Configuration:
        return "configuration error"sv;
    case ErrorKind::Timeout:
        return "timeout"sv;
    case ErrorKind::ExternalCommand:
        return "external command failed"sv;
    }
    return "unknown"sv;
}

auto make_error(ErrorKind kind, std::string message) noexcept -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = kind, .message = std::move(message)});
}

}  // namespace fsprov
