#include "merge/packager.hpp"
#include "merge/progress_sinks.hpp"
#include "merge/run_context.hpp"
#include "merge/run_summary.hpp"
#include "merge/takeout_merger.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"
#include "util/merger_config.hpp"

#include <clocale>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <string>
#include <unistd.h>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config.json>] [--] [output_label]\n"
        "\n"
        "Merges every takeout-*.zip / takeout-*.tgz / takeout-*.tar.gz archive in the\n"
        "current directory into <output_label>-<YYYY-MM-DD>.tar.xz.\n"
        "\n"
        "Options:\n"
        "  -c, --config   JSON configuration file (default: $%s)\n"
        "  -h, --help     Show this help\n"
        "\n"
        "Use -- before a label that starts with '-'.\n",
        argv, takeout::config::kConfigEnvVar);
}

int ExitCodeFor(const takeout::Result &r) {
    switch (r.kind) {
        case takeout::ErrorKind::None:
            return kExitOk;
        case takeout::ErrorKind::Cancelled:
            return kExitCancelled;
        default:
            return kExitFailure;
    }
}

} // namespace

int main(int argc, char **argv) {
    std::setlocale(LC_ALL, "");
    takeout::InstallSignalHandlers();

    std::string config_path;
    if (const char *env = std::getenv(takeout::config::kConfigEnvVar); env && *env) {
        config_path = env;
    }

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;

            case 'c':
                config_path = optarg;
                break;

            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (argc - optind > 1) {
        std::fprintf(stderr, "ERROR: too many arguments\n");
        PrintUsage(argv[0]);
        return kExitUsage;
    }
    const char *label_cli = (optind < argc) ? argv[optind] : nullptr;

    takeout::config::MergerConfigFromFile cfg;
    if (!config_path.empty()) {
        if (auto r = cfg.LoadFile(config_path); !r.ok) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return kExitUsage;
        }
    }

    auto &logger = takeout::Logger::Instance();
    if (cfg.log_level.has_value()) {
        logger.SetLevel(*cfg.log_level);
    }

    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        LogError("Cannot determine current directory: %s", ec.message().c_str());
        return kExitFailure;
    }

    takeout::RunContext ctx;
    ctx.working_dir = cwd.string();
    if (cfg.output_label) ctx.output_label = *cfg.output_label;
    if (label_cli) ctx.output_label = label_cli;
    if (cfg.archive_prefix) ctx.discovery.prefix = *cfg.archive_prefix;
    if (cfg.archive_extensions) ctx.discovery.extensions = *cfg.archive_extensions;
    if (cfg.wrapper_directory) ctx.wrapper_directory = *cfg.wrapper_directory;
    if (cfg.work_root) ctx.work_root = *cfg.work_root;
    if (cfg.output_dir) ctx.output_dir = *cfg.output_dir;
    if (cfg.date_fallback) ctx.date_fallback = *cfg.date_fallback;
    if (cfg.merge_mode) ctx.merge_mode = *cfg.merge_mode;
    if (cfg.compression_level) ctx.compression_level = *cfg.compression_level;
    if (cfg.compression_threads) ctx.compression_threads = *cfg.compression_threads;
    if (cfg.write_checksum) ctx.write_checksum = *cfg.write_checksum;

    if (!takeout::IsValidOutputLabel(ctx.output_label)) {
        std::fprintf(stderr, "ERROR: invalid output label: '%s'\n", ctx.output_label.c_str());
        return kExitUsage;
    }

    takeout::TakeoutMerger merger(std::move(ctx));

    takeout::ConsoleProgressSink progress;
    const bool show_progress = cfg.progress.value_or(true) && ::isatty(STDOUT_FILENO) == 1;
    if (show_progress) {
        merger.SetProgressSink(&progress);
    }

    takeout::RunSummary summary;
    auto res = merger.Run(summary);
    if (!res.ok) {
        LogError("%s: %s", takeout::ErrorKindName(res.kind), res.msg.c_str());
        if (res.kind == takeout::ErrorKind::MissingDependency) {
            std::fprintf(stdout, "%s\n", takeout::kXzInstallHint);
        }
        return ExitCodeFor(res);
    }

    std::fprintf(stdout, "\n");
    takeout::LogRunSummary(summary);
    return kExitOk;
}
