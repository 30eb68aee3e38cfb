#include "doctest_compatibility.h"

#include "fake_host.hpp"

#include "fsprov/logger.hpp"
#include "fsprov/mkfs.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

TEST_CASE("mkfs command test")
{
    const auto& tools = fsprov::tools::default_fs_tools();
    fsprov::FilesystemSpec spec{.name = "data", .fstype = "xfs"};

    SECTION("plain")
    {
        REQUIRE_EQ(fsprov::mkfs::build_mkfs_command(tools, spec, "/dev/mapper/vg0-data"sv), "mkfs -t xfs  -L data /dev/mapper/vg0-data");
    }
    SECTION("force flag from the tool table")
    {
        spec.force = true;
        REQUIRE_EQ(fsprov::mkfs::build_mkfs_command(tools, spec, "/dev/sdb1"sv), "mkfs -t xfs -f  -L data /dev/sdb1");
        spec.fstype = "ext4";
        REQUIRE_EQ(fsprov::mkfs::build_mkfs_command(tools, spec, "/dev/sdb1"sv), "mkfs -t ext4 -F  -L data /dev/sdb1");
    }
    SECTION("force without known flag")
    {
        spec.force  = true;
        spec.fstype = "vfat";
        REQUIRE_EQ(fsprov::mkfs::build_mkfs_command(tools, spec, "/dev/sdb1"sv), "mkfs -t vfat  -L data /dev/sdb1");
    }
    SECTION("mkfs options and label")
    {
        spec.label        = "DATA";
        spec.mkfs_options = "-m crc=1 -i size=512 ";
        REQUIRE_EQ(fsprov::mkfs::build_mkfs_command(tools, spec, "/dev/sdb1"sv), "mkfs -t xfs -m crc=1 -i size=512 -L DATA /dev/sdb1");
    }
    SECTION("required packages")
    {
        REQUIRE_EQ(fsprov::mkfs::required_packages(tools, spec), std::vector<std::string>{"xfsprogs"});
        spec.package = "xfsdump,attr";
        REQUIRE_EQ(fsprov::mkfs::required_packages(tools, spec), std::vector<std::string>{"xfsprogs", "xfsdump", "attr"});
        spec.fstype = "zonefs";
        REQUIRE_EQ(fsprov::mkfs::required_packages(tools, spec), std::vector<std::string>{"xfsdump", "attr"});
    }
}

TEST_CASE("mkfs guard test")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);
    fsprov::logger::set_logger(logger);

    const auto& tools = fsprov::tools::default_fs_tools();
    fsprov::test::FakeHost host{};
    host.existing_paths.emplace("/dev/sdb1");
    host.installed_tools.emplace("mkfs.ext4");

    fsprov::FilesystemSpec spec{.name = "data", .device = "/dev/sdb1", .fstype = "ext4"};

    SECTION("formats a blank device")
    {
        const auto& report = fsprov::mkfs::format_device(host, tools, spec, "/dev/sdb1"sv);
        REQUIRE(report.has_value());
        REQUIRE_FALSE(report->skipped.has_value());
        REQUIRE_EQ(host.checked_commands, std::vector<std::string>{"mkfs -t ext4  -L data /dev/sdb1"});
        REQUIRE_EQ(host.package_installs, std::vector<std::string>{"e2fsprogs"});
        REQUIRE_EQ(host.probes, std::vector<std::string>{"/dev/sdb1:data"});
    }
    SECTION("mounted device")
    {
        host.mounts.emplace("/dev/sdb1", "/srv/data");
        const auto& report = fsprov::mkfs::format_device(host, tools, spec, "/dev/sdb1"sv);
        REQUIRE(report.has_value());
        REQUIRE(report->skipped.has_value());
        REQUIRE(host.checked_commands.empty());
        // nothing else is attempted on a mounted device
        REQUIRE(host.package_installs.empty());
        REQUIRE(host.probes.empty());
    }
    SECTION("missing tools")
    {
        host.installed_tools.clear();
        const auto& report = fsprov::mkfs::format_device(host, tools, spec, "/dev/sdb1"sv);
        REQUIRE(report.has_value());
        REQUIRE(report->skipped.has_value());
        REQUIRE(host.checked_commands.empty());
        REQUIRE_EQ(host.commands, std::vector<std::string>{"which mkfs.ext4"});
    }
    SECTION("force bypasses the tool check")
    {
        host.installed_tools.clear();
        spec.force         = true;
        const auto& report = fsprov::mkfs::format_device(host, tools, spec, "/dev/sdb1"sv);
        REQUIRE(report.has_value());
        REQUIRE(host.commands.empty());
        REQUIRE_EQ(host.checked_commands, std::vector<std::string>{"mkfs -t ext4 -F  -L data /dev/sdb1"});
    }
    SECTION("existing filesystem is kept")
    {
        host.mountable_devices.emplace("/dev/sdb1");
        const auto& report = fsprov::mkfs::format_device(host, tools, spec, "/dev/sdb1"sv);
        REQUIRE(report.has_value());
        REQUIRE(report->skipped.has_value());
        REQUIRE(host.checked_commands.empty());
    }
    SECTION("existing filesystem is kept with force")
    {
        host.mountable_devices.emplace("/dev/sdb1");
        spec.force         = true;
        const auto& report = fsprov::mkfs::format_device(host, tools, spec, "/dev/sdb1"sv);
        REQUIRE(report.has_value());
        REQUIRE(report->skipped.has_value());
        REQUIRE(host.checked_commands.empty());
    }
    SECTION("ignore existing filesystem")
    {
        host.mountable_devices.emplace("/dev/sdb1");
        spec.force           = true;
        spec.ignore_existing = true;
        const auto& report   = fsprov::mkfs::format_device(host, tools, spec, "/dev/sdb1"sv);
        REQUIRE(report.has_value());
        REQUIRE_FALSE(report->skipped.has_value());
        REQUIRE(host.probes.empty());
        REQUIRE_EQ(host.count_commands("mkfs "sv), 1);
    }
    SECTION("mkfs failure")
    {
        host.failing_commands.emplace("mkfs -t ext4  -L data /dev/sdb1", 1);
        const auto& report = fsprov::mkfs::format_device(host, tools, spec, "/dev/sdb1"sv);
        REQUIRE_FALSE(report.has_value());
        REQUIRE_EQ(report.error().kind, fsprov::ErrorKind::ExternalCommand);
        REQUIRE(report.error().message.contains("mkfs -t ext4  -L data /dev/sdb1"));
    }
}
