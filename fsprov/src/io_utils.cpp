#include "fsprov/io_utils.hpp"

#include <sys/wait.h>  // for WEXITSTATUS

#include <cstdio>   // for feof, fgets, pclose, popen
#include <cstdlib>  // for getenv

#include <array>    // for array
#include <memory>   // for unique_ptr
#include <utility>  // for move

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

auto log_and_check_dirty(std::string_view command) noexcept -> bool {
    const bool log_exec_cmds = fsprov::utils::safe_getenv("LOG_EXEC_CMDS") == "1"sv;
    const bool dirty_cmd_run = fsprov::utils::is_dirty_run();

    if ((log_exec_cmds || dirty_cmd_run) && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[exec] cmd := '{}'", command);
    }
    return dirty_cmd_run;
}

}  // namespace

namespace fsprov::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view {
    const char* const raw_val = getenv(env_name);
    return raw_val != nullptr ? std::string_view{raw_val} : std::string_view{};
}

auto is_dirty_run() noexcept -> bool {
    return safe_getenv("DIRTY_CMD_RUN") == "1"sv;
}

// https://github.com/arun11299/cpp-subprocess/blob/master/subprocess.hpp#L1218
auto exec_status(std::string_view command) noexcept -> CommandResult {
    if (log_and_check_dirty(command)) {
        return CommandResult{.exit_status = 0, .output = {}};
    }

    // popen requires a null terminated string
    const std::string command_str{command};
    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(command_str.c_str(), "r"), pclose);
    if (!pipe) {
        spdlog::error("popen failed! '{}'", command);
        return CommandResult{.exit_status = -1, .output = {}};
    }

    std::string result{};
    std::array<char, 128> buffer{};
    while (!feof(pipe.get())) {
        if (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
            result += buffer.data();
        }
    }

    // the exit status is only available through pclose
    const auto status = pclose(pipe.release());
    if (result.ends_with('\n')) {
        result.pop_back();
    }

    std::int32_t exit_status{-1};
    if (status != -1 && WIFEXITED(status)) {
        exit_status = WEXITSTATUS(status);
    }
    return CommandResult{.exit_status = exit_status, .output = std::move(result)};
}

auto exec(std::string_view command) noexcept -> std::string {
    return exec_status(command).output;
}

auto exec_checked(std::string_view command) noexcept -> bool {
    return exec_status(command).success();
}

}  // namespace fsprov::utils
