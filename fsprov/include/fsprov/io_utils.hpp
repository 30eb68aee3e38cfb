#ifndef IO_UTILS_HPP
#define IO_UTILS_HPP

#include <cstdint>      // for int32_t
#include <string>       // for string
#include <string_view>  // for string_view

namespace fsprov::utils {

struct CommandResult {
    std::int32_t exit_status{};
    std::string output{};

    [[nodiscard]] constexpr bool success() const noexcept { return exit_status == 0; }
};

auto safe_getenv(const char* env_name) noexcept -> std::string_view;

// DIRTY_CMD_RUN=1: commands and host writes are logged instead of performed
auto is_dirty_run() noexcept -> bool;

// Runs command through the shell, returning its stdout with the trailing newline stripped
auto exec(std::string_view command) noexcept -> std::string;

// Runs command through the shell, returning exit status and stdout
auto exec_status(std::string_view command) noexcept -> CommandResult;

// Runs command through the shell, true when it exited with status 0
auto exec_checked(std::string_view command) noexcept -> bool;

}  // namespace fsprov::utils

#endif  // IO_UTILS_HPP
