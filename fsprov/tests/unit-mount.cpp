#include "doctest_compatibility.h"

#include "fake_host.hpp"

#include "fsprov/logger.hpp"
#include "fsprov/mount.hpp"

#include <string_view>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

TEST_CASE("mount test")
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

    fsprov::FilesystemSpec spec{
        .name    = "data",
        .device  = "/dev/sdb1",
        .fstype  = "ext4",
        .mount   = "/srv/data",
        .options = "noatime",
        .user    = "www",
        .group   = "www",
        .mode    = "750",
    };

    SECTION("mounts and normalizes the mount point")
    {
        const auto& report = fsprov::mount::mount_filesystem(host, tools, spec, "/dev/sdb1"sv);
        REQUIRE(report.has_value());
        REQUIRE(report->changed());

        REQUIRE_EQ(host.mount_requests.size(), 1);
        REQUIRE_EQ(host.mount_requests[0].device, "/dev/sdb1");
        REQUIRE_EQ(host.mount_requests[0].mountpoint, "/srv/data");
        REQUIRE_EQ(host.mount_requests[0].fstype, "ext4");
        REQUIRE_EQ(host.mount_requests[0].options, "noatime");

        // root owned mount point first, then the requested ownership inside the mount
        REQUIRE_EQ(host.directory_requests.size(), 2);
        REQUIRE_EQ(host.directory_requests[0].owner, "root");
        REQUIRE_EQ(host.directory_requests[1].owner, "www");
        REQUIRE_EQ(host.directory_requests[1].group, "www");
        REQUIRE_EQ(host.directory_requests[1].mode, "750");
    }
    SECTION("already mounted")
    {
        host.mounts.emplace("/dev/sdb1", "/srv/data");
        host.mount_points.emplace("/srv/data");
        const auto& report = fsprov::mount::mount_filesystem(host, tools, spec, "/dev/sdb1"sv);
        REQUIRE(report.has_value());
        REQUIRE(host.mount_requests.empty());
        REQUIRE_EQ(host.directory_requests.size(), 1);
        REQUIRE_EQ(host.directory_requests[0].owner, "www");
    }
    SECTION("network filesystem keeps its permissions")
    {
        spec.fstype        = "nfs4";
        spec.device        = "nas:/export/data";
        const auto& report = fsprov::mount::mount_filesystem(host, tools, spec, "nas:/export/data"sv);
        REQUIRE(report.has_value());
        REQUIRE_EQ(host.mount_requests.size(), 1);
        for (const auto& request : host.directory_requests) {
            REQUIRE_EQ(request.owner, "root");
        }
    }
    SECTION("deferred device")
    {
        spec.device_defer  = true;
        spec.device        = "/dev/sdc1";
        const auto& report = fsprov::mount::mount_filesystem(host, tools, spec, "/dev/sdc1"sv);
        REQUIRE(report.has_value());
        REQUIRE(report->skipped.has_value());
        REQUIRE(host.mount_requests.empty());
    }
    SECTION("mount failure")
    {
        host.failing_commands.emplace("mount", 32);
        const auto& report = fsprov::mount::mount_filesystem(host, tools, spec, "/dev/sdb1"sv);
        REQUIRE_FALSE(report.has_value());
        REQUIRE_EQ(report.error().kind, fsprov::ErrorKind::ExternalCommand);
        // no ownership change on the unmounted directory
        REQUIRE_EQ(host.directory_requests.size(), 1);
    }
    SECTION("no mount point")
    {
        spec.mount.reset();
        const auto& report = fsprov::mount::mount_filesystem(host, tools, spec, "/dev/sdb1"sv);
        REQUIRE(report.has_value());
        REQUIRE(host.mount_requests.empty());
        REQUIRE(host.directory_requests.empty());
    }
}
