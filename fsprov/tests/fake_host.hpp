#ifndef FAKE_HOST_HPP
#define FAKE_HOST_HPP

#include "fsprov/host.hpp"

#include <chrono>       // for milliseconds
#include <cstdint>      // for int32_t
#include <map>          // for map
#include <set>          // for set
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for pair
#include <vector>       // for vector

#include <fmt/compile.h>
#include <fmt/format.h>

namespace fsprov::test {

// In-memory host recording every operation. Successful side effects are
// reflected in later queries, so repeated actions observe their own results.
class FakeHost final : public HostOps {
 public:
    // host state
    std::set<std::string, std::less<>> existing_paths{};
    std::set<std::string, std::less<>> installed_tools{};
    std::set<std::string, std::less<>> installed_packages{};
    std::set<std::string, std::less<>> mountable_devices{};
    std::set<std::pair<std::string, std::string>, std::less<>> mounts{};
    std::set<std::string, std::less<>> mount_points{};
    std::set<std::string, std::less<>> frozen{};
    std::set<std::string, std::less<>> logical_volumes{};
    std::map<std::string, FstabEntry, std::less<>> fstab{};
    // exit status of commands which should fail
    std::map<std::string, std::int32_t, std::less<>> failing_commands{};

    // recorded calls
    std::int32_t path_exists_calls{};
    std::vector<std::chrono::milliseconds> sleeps{};
    std::vector<std::string> checked_commands{};
    std::vector<std::string> commands{};
    std::vector<std::string> package_installs{};
    std::vector<LogicalVolumeRequest> lv_requests{};
    std::vector<BackingFileRequest> backing_file_requests{};
    std::vector<FstabEntry> fstab_upserts{};
    std::vector<MountRequest> mount_requests{};
    std::vector<DirectoryRequest> directory_requests{};
    std::vector<std::string> probes{};
    std::vector<std::string> freeze_requests{};

    auto path_exists(std::string_view path) noexcept -> bool override {
        ++path_exists_calls;
        return existing_paths.contains(path);
    }

    void sleep_for(std::chrono::milliseconds duration) noexcept override {
        sleeps.push_back(duration);
    }

    auto run(std::string_view command) noexcept -> utils::CommandResult override {
        commands.emplace_back(command);
        if (command.starts_with("which ")) {
            const auto tool = command.substr(6);
            return utils::CommandResult{.exit_status = installed_tools.contains(tool) ? 0 : 1, .output = {}};
        }
        return utils::CommandResult{.exit_status = exit_status_of(command), .output = {}};
    }

    auto run_checked(std::string_view command) noexcept -> Result<std::string> override {
        checked_commands.emplace_back(command);
        if (const auto status = exit_status_of(command); status != 0) {
            return make_error(ErrorKind::ExternalCommand, fmt::format(FMT_COMPILE("'{}' exited with status {}"), command, status));
        }
        // a successful mkfs leaves a mountable filesystem behind
        if (command.starts_with("mkfs ")) {
            mountable_devices.emplace(command.substr(command.rfind(' ') + 1));
        }
        return std::string{};
    }

    auto ensure_installed(std::string_view package) noexcept -> Result<bool> override {
        package_installs.emplace_back(package);
        return installed_packages.emplace(package).second;
    }

    auto ensure_logical_volume(const LogicalVolumeRequest& request) noexcept -> Result<bool> override {
        lv_requests.push_back(request);
        existing_paths.emplace(fmt::format(FMT_COMPILE("/dev/mapper/{}-{}"), request.group, request.name));
        return logical_volumes.emplace(fmt::format(FMT_COMPILE("{}/{}"), request.group, request.name)).second;
    }

    auto ensure_backing_file(const BackingFileRequest& request) noexcept -> Result<bool> override {
        backing_file_requests.push_back(request);
        const bool created = existing_paths.emplace(request.path).second;
        const bool attached = !request.device.empty() && existing_paths.emplace(request.device).second;
        return created || attached;
    }

    auto upsert_fstab_entry(const FstabEntry& entry) noexcept -> Result<bool> override {
        fstab_upserts.push_back(entry);
        auto [it, inserted] = fstab.try_emplace(entry.mountpoint, entry);
        if (inserted) {
            return true;
        }
        if (it->second == entry) {
            return false;
        }
        it->second = entry;
        return true;
    }

    auto mount(const MountRequest& request) noexcept -> Result<> override {
        mount_requests.push_back(request);
        if (const auto status = exit_status_of("mount"); status != 0) {
            return make_error(ErrorKind::ExternalCommand, "mount failed");
        }
        mounts.emplace(request.device, request.mountpoint);
        mount_points.emplace(request.mountpoint);
        return {};
    }

    auto ensure_directory(const DirectoryRequest& request) noexcept -> Result<bool> override {
        directory_requests.push_back(request);
        existing_paths.emplace(request.path);
        return true;
    }

    auto is_mounted(std::string_view device) noexcept -> bool override {
        for (const auto& [mounted_device, mountpoint] : mounts) {
            if (mounted_device == device) {
                return true;
            }
        }
        return false;
    }

    auto is_mounted_at(std::string_view device, std::string_view mountpoint) noexcept -> bool override {
        return mounts.contains(std::pair{std::string{device}, std::string{mountpoint}});
    }

    auto is_mount_point(std::string_view path) noexcept -> bool override {
        return mount_points.contains(path);
    }

    auto probe_mountable(std::string_view device, std::string_view label) noexcept -> bool override {
        probes.emplace_back(fmt::format(FMT_COMPILE("{}:{}"), device, label));
        return mountable_devices.contains(device);
    }

    // frozen is the kernel's view, external thaws are modelled by erasing from it
    auto set_frozen(std::string_view mountpoint, bool frozen_state) noexcept -> Result<bool> override {
        const auto& fsfreeze_cmd = fmt::format(FMT_COMPILE("fsfreeze {} {}"), frozen_state ? "--freeze" : "--unfreeze", mountpoint);
        freeze_requests.emplace_back(fsfreeze_cmd);
        if (frozen.contains(mountpoint) == frozen_state) {
            return false;
        }
        if (const auto status = exit_status_of(fsfreeze_cmd); status != 0) {
            return make_error(ErrorKind::ExternalCommand, fmt::format(FMT_COMPILE("'{}' exited with status {}"), fsfreeze_cmd, status));
        }
        if (frozen_state) {
            frozen.emplace(mountpoint);
        } else {
            frozen.erase(std::string{mountpoint});
        }
        return true;
    }

    // Number of recorded checked commands starting with prefix
    [[nodiscard]] auto count_commands(std::string_view prefix) const noexcept -> std::size_t {
        std::size_t count{};
        for (const auto& command : checked_commands) {
            if (command.starts_with(prefix)) {
                ++count;
            }
        }
        return count;
    }

 private:
    [[nodiscard]] auto exit_status_of(std::string_view command) const noexcept -> std::int32_t {
        const auto it = failing_commands.find(command);
        return it != failing_commands.end() ? it->second : 0;
    }
};

}  // namespace fsprov::test

#endif  // FAKE_HOST_HPP
