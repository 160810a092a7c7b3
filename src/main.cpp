#include "driver/driver_registry.hpp"
#include "net/http_client.hpp"
#include "platform/platform.hpp"
#include "platform/platform_probe.hpp"
#include "system/command_runner.hpp"
#include "system/signals.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "util/progress_sinks.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <getopt.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr const char *kDefaultConfigPath = "/etc/webdriver-installer/config.json";

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config>] [-o <dir>] [-b <browser,...>] [--progress] [--parallel] [--list] [-v|-q]\n"
        "\n"
        "Options:\n"
        "  -c, --config           JSON config file (default %s)\n"
        "  -o, --output           Directory receiving the driver binaries (default: current directory)\n"
        "  -b, --browsers         Comma separated browsers to handle (default: all known)\n"
        "  -p, --progress         Show download progress\n"
        "  -P, --parallel         Handle browsers concurrently\n"
        "  -l, --list             List known browsers and exit\n"
        "  -v, --verbose          Debug logging\n"
        "  -q, --quiet            Warnings and errors only\n"
        "  -h, --help             Show this help\n",
        argv, kDefaultConfigPath);
}

struct BrowserRun {
    std::string name;
    wdi::Result result;
    wdi::InstallOutcome outcome;
};

BrowserRun RunOne(const wdi::DriverRegistry &registry,
                  const std::string &name,
                  const wdi::InstallerContext &ctx,
                  const std::string &output_dir) {
    BrowserRun run;
    run.name = name;

    std::unique_ptr<wdi::DriverInstaller> installer;
    run.result = registry.Create(name, ctx, installer);
    if (!run.result.is_ok()) return run;

    run.result = installer->InstallIfNeeded(output_dir, run.outcome);
    return run;
}

} // namespace

int main(int argc, char **argv) {
    wdi::InstallSignalHandlers();

    std::string config_path = kDefaultConfigPath;
    bool config_explicit = false;
    std::optional<std::string> out_cli;
    std::optional<std::string> browsers_cli;
    std::optional<wdi::LogLevel> level_cli;
    bool progress_cli = false;
    bool parallel_cli = false;
    bool list_only = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"output", required_argument, nullptr, 'o'},
        {"browsers", required_argument, nullptr, 'b'},
        {"progress", no_argument, nullptr, 'p'},
        {"parallel", no_argument, nullptr, 'P'},
        {"list", no_argument, nullptr, 'l'},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:o:b:pPlvq", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                config_explicit = true;
                break;

            case 'o':
                out_cli = optarg;
                break;

            case 'b':
                browsers_cli = optarg;
                break;

            case 'p':
                progress_cli = true;
                break;

            case 'P':
                parallel_cli = true;
                break;

            case 'l':
                list_only = true;
                break;

            case 'v':
                level_cli = wdi::LogLevel::Debug;
                break;

            case 'q':
                level_cli = wdi::LogLevel::Warn;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind < argc) {
        std::fprintf(stderr, "Unexpected argument: %s\n", argv[optind]);
        PrintUsage(argv[0]);
        return 2;
    }

    const wdi::DriverRegistry registry = wdi::DriverRegistry::WithBuiltins();

    if (list_only) {
        for (const auto &name : registry.Names()) {
            std::printf("%s\n", name.c_str());
        }
        return 0;
    }

    wdi::config::InstallerConfigFromFile cfg;
    std::error_code ec;
    const bool cfg_present = config_explicit || std::filesystem::exists(config_path, ec);
    if (cfg_present && !cfg.LoadFile(config_path)) {
        std::fprintf(stderr, "ERROR: cannot load config %s: %s\n", config_path.c_str(), cfg.Error().c_str());
        return 1;
    }

    if (level_cli) {
        wdi::Logger::Instance().SetLevel(*level_cli);
    } else if (cfg.log_level) {
        // Validated by the config loader.
        wdi::Logger::Instance().SetLevel(wdi::ParseLogLevel(*cfg.log_level).value_or(wdi::LogLevel::Info));
    }

    std::vector<std::string> browsers;
    if (browsers_cli) {
        auto parsed = wdi::ParseBrowserList(*browsers_cli);
        if (!parsed) {
            std::fprintf(stderr, "Invalid --browsers: %s\n", parsed.error().c_str());
            return 2;
        }
        browsers = std::move(*parsed);
    } else if (!cfg.browsers.empty()) {
        browsers = cfg.browsers;
    } else {
        browsers = registry.Names();
    }
    for (const auto &name : browsers) {
        if (!registry.Contains(name)) {
            std::fprintf(stderr, "Unknown browser: %s\n", name.c_str());
            return 2;
        }
    }

    const std::string output_dir = out_cli ? *out_cli : cfg.output_directory.value_or(".");
    const bool progress = progress_cli || cfg.progress.value_or(false);
    const bool parallel = parallel_cli || cfg.parallel.value_or(false);

    wdi::CurlGlobal curl_global;
    if (!curl_global.ok()) {
        std::fprintf(stderr, "ERROR: curl_global_init failed\n");
        return 1;
    }

    wdi::CurlHttpClient::Options http_opt;
    if (cfg.http_timeout_ms) http_opt.total_timeout = std::chrono::milliseconds(*cfg.http_timeout_ms);
    if (cfg.connect_timeout_ms) http_opt.connect_timeout = std::chrono::milliseconds(*cfg.connect_timeout_ms);
    auto http = std::make_shared<wdi::CurlHttpClient>(http_opt);

    wdi::PlatformProbe::Options probe_opt;
    if (cfg.command_timeout_ms) probe_opt.command_timeout = std::chrono::milliseconds(*cfg.command_timeout_ms);

    wdi::ConsoleProgressSink progress_sink;

    wdi::ArchiveInstaller::Options archive_opt;
    if (cfg.github_api_base) archive_opt.github_api_base = *cfg.github_api_base;
    if (cfg.github_token) {
        archive_opt.github_token = *cfg.github_token;
    } else if (const char *env = std::getenv("GITHUB_TOKEN"); env && *env) {
        archive_opt.github_token = env;
    }
    archive_opt.progress_sink = progress ? &progress_sink : nullptr;

    wdi::InstallerContext ctx;
    ctx.platform = wdi::DetectHostPlatform();
    ctx.probe = std::make_shared<wdi::PlatformProbe>(wdi::DefaultCommandRunner(), probe_opt);
    ctx.archives = std::make_shared<wdi::ArchiveInstaller>(http, archive_opt);

    LogInfo("Host %s (%s), output directory %s",
            wdi::OsFamilyName(ctx.platform.os), ctx.platform.os_name.c_str(), output_dir.c_str());

    std::vector<BrowserRun> runs;
    if (parallel && browsers.size() > 1) {
        std::vector<std::future<BrowserRun>> pending;
        pending.reserve(browsers.size());
        for (const auto &name : browsers) {
            pending.push_back(std::async(std::launch::async, RunOne,
                                         std::cref(registry), name, std::cref(ctx), std::cref(output_dir)));
        }
        for (auto &f : pending) runs.push_back(f.get());
    } else {
        for (const auto &name : browsers) {
            runs.push_back(RunOne(registry, name, ctx, output_dir));
            if (wdi::g_cancel.load(std::memory_order_relaxed)) break;
        }
    }

    if (wdi::IsProgressLineActive()) wdi::ClearProgressLine();

    int rc = 0;
    for (const auto &run : runs) {
        if (!run.result.is_ok()) {
            LogError("[%s] %s: %s", run.name.c_str(), wdi::ErrorKindName(run.result.kind), run.result.msg.c_str());
            rc = 1;
            continue;
        }
        const auto &o = run.outcome;
        switch (o.status) {
            case wdi::InstallStatus::BrowserNotFound:
                std::printf("%s: not installed\n", run.name.c_str());
                break;
            case wdi::InstallStatus::UpToDate:
                std::printf("%s %s: driver %s up to date (%s)\n", run.name.c_str(), o.browser_version.c_str(),
                            o.driver_version.c_str(), o.artifact_path.c_str());
                break;
            case wdi::InstallStatus::Installed:
                std::printf("%s %s: installed driver %s (%s)\n", run.name.c_str(), o.browser_version.c_str(),
                            o.driver_version.c_str(), o.artifact_path.c_str());
                break;
        }
    }

    if (wdi::g_cancel.load(std::memory_order_relaxed)) {
        LogWarn("Interrupted");
        return 1;
    }
    return rc;
}
