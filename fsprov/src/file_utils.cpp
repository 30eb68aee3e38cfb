#include "fsprov/file_utils.hpp"

#include <cerrno>   // for errno
#include <cstring>  // for strerror

#include <filesystem>  // for path
#include <fstream>     // for ifstream, ofstream
#include <utility>     // for move

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace fsprov::file_utils {

auto read_whole_file(std::string_view filepath) noexcept -> std::optional<std::string> {
    std::ifstream file(fs::path{filepath}, std::ios::binary);
    if (!file.is_open()) {
        // logging may clobber errno, callers report it too
        const int saved_errno = errno;
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(saved_errno));
        errno = saved_errno;
        return std::nullopt;
    }

    std::string content{};
    std::string line{};
    while (std::getline(file, line)) {
        content += line;
        content += '\n';
    }
    return std::make_optional<std::string>(std::move(content));
}

auto create_file_for_overwrite(std::string_view filepath, std::string_view data) noexcept -> bool {
    std::ofstream file{fs::path{filepath}, std::ios::out | std::ios::trunc};
    if (!file.is_open()) {
        const int saved_errno = errno;
        spdlog::error("[WRITE_TO_FILE] '{}' open failed: {}", filepath, std::strerror(saved_errno));
        errno = saved_errno;
        return false;
    }
    file << data;
    return static_cast<bool>(file);
}

}  // namespace fsprov::file_utils
