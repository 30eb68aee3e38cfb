#include "spec_config.hpp"  // for load_spec_config

// import fsprov
#include "fsprov/file_utils.hpp"
#include "fsprov/fs_tools.hpp"
#include "fsprov/logger.hpp"
#include "fsprov/provider.hpp"
#include "fsprov/system_host.hpp"

#include <getopt.h>  // for getopt_long
#include <unistd.h>  // for geteuid

#include <cstdio>   // for fputs
#include <cstdlib>  // for setenv

#include <memory>    // for make_shared
#include <optional>  // for optional
#include <string>    // for string
#include <utility>   // for move
#include <vector>    // for vector

#include <fmt/core.h>

#include <spdlog/common.h>                     // for debug
#include <spdlog/sinks/basic_file_sink.h>      // for basic_file_sink_mt
#include <spdlog/sinks/stdout_color_sinks.h>  // for stderr_color_sink_mt
#include <spdlog/spdlog.h>                     // for set_default_logger, set_level

namespace {

enum ExitCode : int {
    kExitOk            = 0,
    kExitConfigError   = 1,
    kExitActionFailure = 2,
};

struct CliOptions {
    std::string config_file{};
    std::string tools_file{};
    std::string log_file{};
    bool verbose{false};
    bool dry_run{false};
    std::vector<std::string> actions{};
};

void print_help() noexcept {
    std::fputs(R"(Usage: fsprov [options] [action...]

Converge a filesystem described by a JSON spec.

Options:
  -c, --config <file>   JSON file holding the filesystem spec (required)
  -t, --tools <file>    TOML tool table overriding the built-in one
  -v, --verbose         debug logging
  -l, --log <file>      also log into file
  -n, --dry-run         log commands instead of running them
  -h, --help            show this help

Actions (run in the given order, default: create):
  create     create backing storage and the filesystem
  enable     add the filesystem to /etc/fstab
  mount      mount the filesystem
  freeze     suspend writes with fsfreeze
  unfreeze   resume writes
)",
        stdout);
}

auto parse_args(int argc, char* argv[]) -> std::optional<CliOptions> {
    CliOptions opts{};

    static struct option long_options[] = {{"config", required_argument, nullptr, 'c'},
                                           {"tools", required_argument, nullptr, 't'},
                                           {"verbose", no_argument, nullptr, 'v'},
                                           {"log", required_argument, nullptr, 'l'},
                                           {"dry-run", no_argument, nullptr, 'n'},
                                           {"help", no_argument, nullptr, 'h'},
                                           {nullptr, 0, nullptr, 0}};

    int opt{};
    int option_index{};
    while ((opt = getopt_long(argc, argv, "c:t:vl:nh", long_options, &option_index)) != -1) {
        switch (opt) {
        case 'c':
            opts.config_file = optarg;
            break;
        case 't':
            opts.tools_file = optarg;
            break;
        case 'v':
            opts.verbose = true;
            break;
        case 'l':
            opts.log_file = optarg;
            break;
        case 'n':
            opts.dry_run = true;
            break;
        case 'h':
            print_help();
            std::exit(kExitOk);
        default:
            print_help();
            return std::nullopt;
        }
    }

    while (optind < argc) {
        opts.actions.emplace_back(argv[optind]);
        ++optind;
    }
    if (opts.actions.empty()) {
        opts.actions.emplace_back("create");
    }
    return opts;
}

void init_logger(const CliOptions& opts) {
    std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
    if (!opts.log_file.empty()) {
        sinks.emplace_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(opts.log_file));
    }

    auto logger = std::make_shared<spdlog::logger>("fsprov_logger", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%r][%^---%L---%$] %v");
    spdlog::set_level(opts.verbose ? spdlog::level::debug : spdlog::level::info);

    // Set fsprov logger.
    fsprov::logger::set_logger(logger);
}

auto load_tools(const CliOptions& opts) -> std::optional<fsprov::tools::FsTools> {
    if (opts.tools_file.empty()) {
        return fsprov::tools::default_fs_tools();
    }
    auto tools_content = fsprov::file_utils::read_whole_file(opts.tools_file);
    if (!tools_content) {
        return std::nullopt;
    }
    return fsprov::tools::parse_fs_tools(*tools_content);
}

}  // namespace

int main(int argc, char* argv[]) {
    auto opts = parse_args(argc, argv);
    if (!opts) {
        return kExitConfigError;
    }

    try {
        init_logger(*opts);
    } catch (const spdlog::spdlog_ex& ex) {
        fmt::print(stderr, "Failed to initialize logger: {}\n", ex.what());
        return kExitConfigError;
    }

    if (opts->config_file.empty()) {
        spdlog::error("No spec given, use --config <file>");
        return kExitConfigError;
    }

    std::vector<fsprov::Action> actions{};
    for (const auto& action_str : opts->actions) {
        auto action = fsprov::action_from_string(action_str);
        if (!action) {
            spdlog::error("Unknown action '{}'. Valid actions: create, enable, mount, freeze, unfreeze", action_str);
            return kExitConfigError;
        }
        actions.push_back(*action);
    }

    if (opts->dry_run) {
        setenv("DIRTY_CMD_RUN", "1", 1);
    } else if (geteuid() != 0) {
        spdlog::error("fsprov must be run with root privileges!");
        return kExitConfigError;
    }

    auto spec = cli::load_spec_config(opts->config_file);
    if (!spec) {
        spdlog::error("Invalid spec '{}': {}", opts->config_file, spec.error());
        return kExitConfigError;
    }

    auto tools = load_tools(*opts);
    if (!tools) {
        spdlog::error("Failed to load tool table '{}'", opts->tools_file);
        return kExitConfigError;
    }

    fsprov::SystemHost host{tools->package_manager};
    fsprov::Provider provider{host, std::move(*tools), std::move(*spec)};

    for (const auto action : actions) {
        const auto action_name = fsprov::action_to_string(action);
        auto report            = provider.run(action);
        if (!report) {
            const auto& err = report.error();
            spdlog::error("filesystem {}: {} failed ({}): {}", provider.spec().effective_label(), action_name,
                fsprov::error_kind_to_string(err.kind), err.message);
            spdlog::shutdown();
            return err.kind == fsprov::ErrorKind::Configuration ? kExitConfigError : kExitActionFailure;
        }
        if (report->changed()) {
            spdlog::info("filesystem {}: {} made {} change(s)", provider.spec().effective_label(), action_name, report->changes.size());
        } else {
            spdlog::info("filesystem {}: {} is up to date", provider.spec().effective_label(), action_name);
        }
    }

    spdlog::shutdown();
    return kExitOk;
}
