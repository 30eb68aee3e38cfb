#include "doctest_compatibility.h"

#include "fake_host.hpp"

#include "fsprov/freeze.hpp"
#include "fsprov/logger.hpp"

#include <string>
#include <vector>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

TEST_CASE("freeze test")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);
    fsprov::logger::set_logger(logger);

    fsprov::test::FakeHost host{};
    fsprov::FilesystemSpec spec{.name = "data", .mount = "/srv/data"};

    SECTION("freeze twice")
    {
        auto report = fsprov::freeze::freeze_filesystem(host, spec);
        REQUIRE(report.has_value());
        REQUIRE(report->changed());
        REQUIRE_EQ(report->changes, std::vector<std::string>{"Freeze /srv/data"});
        REQUIRE(host.frozen.contains("/srv/data"));

        report = fsprov::freeze::freeze_filesystem(host, spec);
        REQUIRE(report.has_value());
        REQUIRE_FALSE(report->changed());
        REQUIRE(report->skipped.has_value());
        REQUIRE_EQ(*report->skipped, "/srv/data is already frozen");
        REQUIRE(host.frozen.contains("/srv/data"));

        report = fsprov::freeze::unfreeze_filesystem(host, spec);
        REQUIRE(report.has_value());
        REQUIRE(report->changed());
        REQUIRE_FALSE(host.frozen.contains("/srv/data"));
        REQUIRE_EQ(host.freeze_requests.back(), "fsfreeze --unfreeze /srv/data");
    }
    SECTION("unfreeze of a thawed filesystem")
    {
        const auto& report = fsprov::freeze::unfreeze_filesystem(host, spec);
        REQUIRE(report.has_value());
        REQUIRE_FALSE(report->changed());
        REQUIRE(report->skipped.has_value());
        REQUIRE_EQ(*report->skipped, "/srv/data is already unfrozen");
    }
    SECTION("thawed outside of fsprov")
    {
        REQUIRE(fsprov::freeze::freeze_filesystem(host, spec)->changed());

        // e.g. `fsfreeze --unfreeze` run by hand, only the kernel knows
        host.frozen.erase("/srv/data");

        const auto& report = fsprov::freeze::freeze_filesystem(host, spec);
        REQUIRE(report.has_value());
        REQUIRE(report->changed());
        REQUIRE(host.frozen.contains("/srv/data"));
        REQUIRE_EQ(host.freeze_requests, std::vector<std::string>{"fsfreeze --freeze /srv/data", "fsfreeze --freeze /srv/data"});
    }
    SECTION("frozen outside of fsprov")
    {
        host.frozen.emplace("/srv/data");

        auto report = fsprov::freeze::freeze_filesystem(host, spec);
        REQUIRE(report.has_value());
        REQUIRE_FALSE(report->changed());

        report = fsprov::freeze::unfreeze_filesystem(host, spec);
        REQUIRE(report.has_value());
        REQUIRE(report->changed());
        REQUIRE(host.frozen.empty());
    }
    SECTION("mount not specified")
    {
        spec.mount.reset();
        for (const auto& report : {fsprov::freeze::freeze_filesystem(host, spec), fsprov::freeze::unfreeze_filesystem(host, spec)}) {
            REQUIRE_FALSE(report.has_value());
            REQUIRE_EQ(report.error().kind, fsprov::ErrorKind::Configuration);
            REQUIRE_EQ(report.error().message, "mount not specified");
        }
        REQUIRE(host.freeze_requests.empty());
    }
    SECTION("fsfreeze failure leaves state untouched")
    {
        host.failing_commands.emplace("fsfreeze --freeze /srv/data", 1);
        const auto& report = fsprov::freeze::freeze_filesystem(host, spec);
        REQUIRE_FALSE(report.has_value());
        REQUIRE_EQ(report.error().kind, fsprov::ErrorKind::ExternalCommand);
        REQUIRE_FALSE(host.frozen.contains("/srv/data"));
    }
}
