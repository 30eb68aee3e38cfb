#include "fsprov/system_host.hpp"
#include "fsprov/fstab.hpp"
#include "fsprov/file_utils.hpp"
#include "fsprov/io_utils.hpp"
#include "fsprov/mtab.hpp"

#include <grp.h>       // for getgrnam
#include <pwd.h>       // for getpwnam
#include <sys/stat.h>  // for stat
#include <unistd.h>    // for chown

#include <cerrno>   // for errno
#include <cstring>  // for strerror

#include <algorithm>     // for any_of
#include <charconv>      // for from_chars
#include <filesystem>    // for exists, create_directories
#include <system_error>  // for error_code
#include <thread>        // for sleep_for
#include <utility>       // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

namespace {

auto os_error(std::string_view what, std::string_view path, std::string_view reason) noexcept -> std::unexpected<fsprov::Error> {
    return fsprov::make_error(fsprov::ErrorKind::ExternalCommand, fmt::format(FMT_COMPILE("{} '{}' failed: {}"), what, path, reason));
}

// Paths under /dev are often symlinks (/dev/mapper/*, /dev/disk/by-uuid/*),
// while the mount table may list either the link or its target
auto device_aliases(std::string_view device) noexcept -> std::vector<std::string> {
    std::vector<std::string> aliases{std::string{device}};
    std::error_code err{};
    const auto& canonical = fs::canonical(fs::path{device}, err);
    if (!err && canonical.string() != device) {
        aliases.emplace_back(canonical.string());
    }
    return aliases;
}

auto normalize_path(std::string_view path) noexcept -> std::string {
    std::error_code err{};
    auto normalized = fs::weakly_canonical(fs::path{path}, err);
    if (err) {
        return std::string{path};
    }
    auto result = normalized.string();
    if (result.size() > 1 && result.ends_with('/')) {
        result.pop_back();
    }
    return result;
}

}  // namespace

namespace fsprov {

auto make_lvcreate_command(const LogicalVolumeRequest& request) noexcept -> std::string {
    const auto size_flag = request.size.contains('%') ? "-l"sv : "-L"sv;

    auto lvcreate_cmd = fmt::format(FMT_COMPILE("lvcreate -y -n {} {} {}"), request.name, size_flag, request.size);
    if (request.stripes) {
        lvcreate_cmd += fmt::format(FMT_COMPILE(" -i {}"), *request.stripes);
    }
    if (request.mirrors) {
        lvcreate_cmd += fmt::format(FMT_COMPILE(" -m {}"), *request.mirrors);
    }
    lvcreate_cmd += fmt::format(FMT_COMPILE(" {}"), request.group);
    return lvcreate_cmd;
}

auto fsfreeze_already_in_state(std::string_view output, bool frozen) noexcept -> bool {
    // FIFREEZE on a frozen filesystem fails with EBUSY, FITHAW on a thawed one with EINVAL
    return output.contains(frozen ? "Device or resource busy"sv : "Invalid argument"sv);
}

auto parse_mode(std::string_view mode) noexcept -> std::optional<std::uint32_t> {
    if (mode.empty() || mode.size() > 4) {
        return std::nullopt;
    }
    std::uint32_t value{};
    const auto* end = mode.data() + mode.size();
    const auto [ptr, ec] = std::from_chars(mode.data(), end, value, 8);
    if (ec != std::errc{} || ptr != end || value > 07777) {
        return std::nullopt;
    }
    return value;
}

SystemHost::SystemHost(tools::PackageManager package_manager, SystemPaths paths) noexcept
  : m_package_manager(std::move(package_manager)), m_paths(std::move(paths)) { }

auto SystemHost::path_exists(std::string_view path) noexcept -> bool {
    std::error_code err{};
    return !path.empty() && ::fs::exists(::fs::path{path}, err);
}

void SystemHost::sleep_for(std::chrono::milliseconds duration) noexcept {
    std::this_thread::sleep_for(duration);
}

auto SystemHost::run(std::string_view command) noexcept -> utils::CommandResult {
    return utils::exec_status(command);
}

auto SystemHost::run_checked(std::string_view command) noexcept -> Result<std::string> {
    auto result = utils::exec_status(command);
    if (!result.success()) {
        spdlog::error("'{}' exited with status {}", command, result.exit_status);
        return make_error(ErrorKind::ExternalCommand, fmt::format(FMT_COMPILE("'{}' exited with status {}: {}"), command, result.exit_status, result.output));
    }
    return std::move(result.output);
}

auto SystemHost::ensure_installed(std::string_view package) noexcept -> Result<bool> {
    std::string query_cmd{};
    std::string install_cmd{};
    try {
        query_cmd   = fmt::format(fmt::runtime(m_package_manager.query), package);
        install_cmd = fmt::format(fmt::runtime(m_package_manager.install), package);
    } catch (const fmt::format_error& err) {
        return make_error(ErrorKind::Configuration, fmt::format(FMT_COMPILE("invalid package manager command: {}"), err.what()));
    }

    if (utils::exec_checked(fmt::format(FMT_COMPILE("{} >/dev/null 2>&1"), query_cmd))) {
        return false;
    }
    if (auto installed = run_checked(install_cmd); !installed) {
        return std::unexpected(std::move(installed.error()));
    }
    return true;
}

auto SystemHost::ensure_logical_volume(const LogicalVolumeRequest& request) noexcept -> Result<bool> {
    if (utils::exec_checked(fmt::format(FMT_COMPILE("lvs {}/{} >/dev/null 2>&1"), request.group, request.name))) {
        spdlog::debug("logical volume {}/{} already exists", request.group, request.name);
        return false;
    }

    if (auto created = run_checked(make_lvcreate_command(request)); !created) {
        return std::unexpected(std::move(created.error()));
    }
    return true;
}

auto SystemHost::ensure_backing_file(const BackingFileRequest& request) noexcept -> Result<bool> {
    bool changed{false};

    if (!path_exists(request.path)) {
        const auto& parent = ::fs::path{request.path}.parent_path();
        std::error_code err{};
        if (utils::is_dirty_run()) {
            spdlog::debug("[DRY-RUN] create directory '{}'", parent.string());
        } else if (!parent.empty()) {
            ::fs::create_directories(parent, err);
        }
        if (err) {
            return os_error("create directory", parent.string(), err.message());
        }

        // sparse files only get blocks allocated on write
        const auto& alloc_cmd = request.sparse
            ? fmt::format(FMT_COMPILE("truncate -s {} {}"), request.size, request.path)
            : fmt::format(FMT_COMPILE("fallocate -l {} {}"), request.size, request.path);
        if (auto allocated = run_checked(alloc_cmd); !allocated) {
            return std::unexpected(std::move(allocated.error()));
        }
        changed = true;
    }

    if (request.device.empty()) {
        return changed;
    }

    // e.g '/dev/loop7: [66306]:1234 (/srv/data.img)'
    const auto& attached = utils::exec(fmt::format(FMT_COMPILE("losetup -j {} 2>/dev/null"), request.path));
    if (attached.starts_with(fmt::format(FMT_COMPILE("{}:"), request.device))) {
        return changed;
    }
    if (auto attach = run_checked(fmt::format(FMT_COMPILE("losetup {} {}"), request.device, request.path)); !attach) {
        return std::unexpected(std::move(attach.error()));
    }
    return true;
}

auto SystemHost::upsert_fstab_entry(const FstabEntry& entry) noexcept -> Result<bool> {
    std::string fstab_content{};
    if (path_exists(m_paths.fstab)) {
        auto content = file_utils::read_whole_file(m_paths.fstab);
        if (!content) {
            const int read_errno = errno;
            return os_error("read", m_paths.fstab, std::strerror(read_errno));
        }
        fstab_content = std::move(*content);
    }

    const auto& update = fs::upsert_fstab_content(fstab_content, entry);
    if (!update.changed) {
        return false;
    }
    if (utils::is_dirty_run()) {
        spdlog::debug("[DRY-RUN] write '{}':\n{}", m_paths.fstab, update.content);
        return true;
    }

    errno = 0;
    if (!file_utils::create_file_for_overwrite(m_paths.fstab, update.content)) {
        const int write_errno = errno;
        return os_error("write", m_paths.fstab, write_errno != 0 ? std::strerror(write_errno) : "short write");
    }
    return true;
}

auto SystemHost::mount(const MountRequest& request) noexcept -> Result<> {
    const auto& mount_cmd = request.options.empty()
        ? fmt::format(FMT_COMPILE("mount -t {} {} {}"), request.fstype, request.device, request.mountpoint)
        : fmt::format(FMT_COMPILE("mount -t {} -o {} {} {}"), request.fstype, request.options, request.device, request.mountpoint);
    if (auto mounted = run_checked(mount_cmd); !mounted) {
        return std::unexpected(std::move(mounted.error()));
    }
    return {};
}

auto SystemHost::ensure_directory(const DirectoryRequest& request) noexcept -> Result<bool> {
    bool changed{false};
    const ::fs::path dir_path{request.path};

    const bool dirty_run = utils::is_dirty_run();

    std::error_code err{};
    if (!::fs::is_directory(dir_path, err)) {
        if (dirty_run) {
            // nothing to stat yet, ownership and mode would be applied after creation
            spdlog::debug("[DRY-RUN] create directory '{}'", request.path);
            return true;
        }
        err.clear();
        if (request.recursive) {
            ::fs::create_directories(dir_path, err);
        } else {
            ::fs::create_directory(dir_path, err);
        }
        if (err) {
            return os_error("create directory", request.path, err.message());
        }
        changed = true;
    }

    struct stat dir_stat{};
    if (::stat(request.path.c_str(), &dir_stat) != 0) {
        return os_error("stat", request.path, std::strerror(errno));
    }

    uid_t uid = static_cast<uid_t>(-1);
    gid_t gid = static_cast<gid_t>(-1);
    if (request.owner) {
        const auto* pw = ::getpwnam(request.owner->c_str());
        if (pw == nullptr) {
            return make_error(ErrorKind::Configuration, fmt::format(FMT_COMPILE("unknown user '{}'"), *request.owner));
        }
        if (pw->pw_uid != dir_stat.st_uid) {
            uid = pw->pw_uid;
        }
    }
    if (request.group) {
        const auto* gr = ::getgrnam(request.group->c_str());
        if (gr == nullptr) {
            return make_error(ErrorKind::Configuration, fmt::format(FMT_COMPILE("unknown group '{}'"), *request.group));
        }
        if (gr->gr_gid != dir_stat.st_gid) {
            gid = gr->gr_gid;
        }
    }
    if (uid != static_cast<uid_t>(-1) || gid != static_cast<gid_t>(-1)) {
        if (dirty_run) {
            spdlog::debug("[DRY-RUN] chown '{}'", request.path);
        } else if (::chown(request.path.c_str(), uid, gid) != 0) {
            return os_error("chown", request.path, std::strerror(errno));
        }
        changed = true;
    }

    if (request.mode) {
        const auto mode = parse_mode(*request.mode);
        if (!mode) {
            return make_error(ErrorKind::Configuration, fmt::format(FMT_COMPILE("invalid mode '{}'"), *request.mode));
        }
        if ((dir_stat.st_mode & 07777) != *mode) {
            if (dirty_run) {
                spdlog::debug("[DRY-RUN] chmod {:o} '{}'", *mode, request.path);
            } else {
                ::fs::permissions(dir_path, static_cast<::fs::perms>(*mode), ::fs::perm_options::replace, err);
            }
            if (err) {
                return os_error("chmod", request.path, err.message());
            }
            changed = true;
        }
    }
    return changed;
}

auto SystemHost::is_mounted(std::string_view device) noexcept -> bool {
    const auto& entries = mtab::parse_mtab(m_paths.mounts);
    if (!entries) {
        spdlog::warn("Failed to parse {}", m_paths.mounts);
        return false;
    }
    return std::ranges::any_of(device_aliases(device), [&](auto&& alias) { return mtab::has_device(*entries, alias); });
}

auto SystemHost::is_mounted_at(std::string_view device, std::string_view mountpoint) noexcept -> bool {
    const auto& entries = mtab::parse_mtab(m_paths.mounts);
    if (!entries) {
        spdlog::warn("Failed to parse {}", m_paths.mounts);
        return false;
    }
    const auto& normalized_mountpoint = normalize_path(mountpoint);
    return std::ranges::any_of(device_aliases(device), [&](auto&& alias) {
        return mtab::has_device_at(*entries, alias, normalized_mountpoint);
    });
}

auto SystemHost::is_mount_point(std::string_view path) noexcept -> bool {
    struct stat path_stat{};
    const std::string path_str{path};
    if (::stat(path_str.c_str(), &path_stat) != 0 || !S_ISDIR(path_stat.st_mode)) {
        return false;
    }

    // different device than the parent -> mount point, same inode -> root
    struct stat parent_stat{};
    const auto& parent_path = fmt::format(FMT_COMPILE("{}/.."), path_str);
    if (::stat(parent_path.c_str(), &parent_stat) == 0) {
        if (path_stat.st_dev != parent_stat.st_dev || path_stat.st_ino == parent_stat.st_ino) {
            return true;
        }
    }

    // bind mounts keep the device, look them up in the mount table
    const auto& entries = mtab::parse_mtab(m_paths.mounts);
    if (!entries) {
        return false;
    }
    const auto& normalized = normalize_path(path);
    return std::ranges::any_of(*entries, [&](auto&& entry) { return entry.mountpoint == normalized; });
}

auto SystemHost::probe_mountable(std::string_view device, std::string_view label) noexcept -> bool {
    const auto& check_dir = fmt::format(FMT_COMPILE("{}/{}"), m_paths.probe_dir, label);

    // failure to create the directory is ignored, the mount below then fails on its own
    static_cast<void>(utils::exec_status(fmt::format(FMT_COMPILE("mkdir -p {}"), check_dir)));
    return utils::exec_checked(fmt::format(FMT_COMPILE("mount {0} {1} >/dev/null 2>&1 && umount {1}"), device, check_dir));
}

auto SystemHost::set_frozen(std::string_view mountpoint, bool frozen) noexcept -> Result<bool> {
    // LC_ALL=C keeps the errno text stable for fsfreeze_already_in_state
    const auto& fsfreeze_cmd = fmt::format(FMT_COMPILE("LC_ALL=C fsfreeze {} {} 2>&1"), frozen ? "--freeze" : "--unfreeze", mountpoint);
    auto result = utils::exec_status(fsfreeze_cmd);
    if (result.success()) {
        return true;
    }
    if (fsfreeze_already_in_state(result.output, frozen)) {
        spdlog::debug("fsfreeze reports {} as already {}", mountpoint, frozen ? "frozen" : "unfrozen");
        return false;
    }
    spdlog::error("'{}' exited with status {}", fsfreeze_cmd, result.exit_status);
    return make_error(ErrorKind::ExternalCommand, fmt::format(FMT_COMPILE("'{}' exited with status {}: {}"), fsfreeze_cmd, result.exit_status, result.output));
}

}  // namespace fsprov
