#include "apg/console_reporter.hpp"
#include "apg/metadata.hpp"
#include "apg/package_checker.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <clocale>
#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <optional>
#include <string>
#include <utility>

#ifndef APGCHECK_VERSION
#define APGCHECK_VERSION "0.0.0"
#endif

namespace {

constexpr int kExitOk = 0;
constexpr int kExitInvalid = 1;
constexpr int kExitUsage = 2;

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s -a <archive.apg|-> [-f <1|2>] [-c <config>] [--no-color] [-v]\n"
        "\n"
        "Options:\n"
        "  -a, --apgfile          Path to the APG archive, or '-' for stdin\n"
        "  -f, --format-version   Metadata format version: 1 or 2 (default 1)\n"
        "  -c, --config           JSON config file (default %s)\n"
        "  -n, --no-color         Disable coloured output\n"
        "  -v, --verbose          Debug logging on stderr\n"
        "  -V, --version          Print version and exit\n"
        "  -h, --help             Show this help\n",
        argv, apg::config::kDefaultConfigPath);
}

} // namespace

int main(int argc, char **argv) {
    // Entry names in pax headers are UTF-8; let libarchive convert them.
    std::setlocale(LC_CTYPE, "");

    const char *apg_file = nullptr;
    const char *config_cli = nullptr;
    std::optional<apg::FormatVersion> version_cli;
    bool no_color = false;
    bool verbose = false;

    static option long_opts[] = {
        {"apgfile", required_argument, nullptr, 'a'},
        {"format-version", required_argument, nullptr, 'f'},
        {"config", required_argument, nullptr, 'c'},
        {"no-color", no_argument, nullptr, 'n'},
        {"verbose", no_argument, nullptr, 'v'},
        {"version", no_argument, nullptr, 'V'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "ha:f:c:nvV", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;

            case 'V':
                std::printf("apgcheck %s\n", APGCHECK_VERSION);
                return kExitOk;

            case 'a':
                apg_file = optarg;
                break;

            case 'f':
                version_cli = apg::ParseFormatVersion(std::string(optarg));
                if (!version_cli) {
                    std::fprintf(stderr, "Invalid --format-version: %s (expected 1 or 2)\n", optarg);
                    return kExitUsage;
                }
                break;

            case 'c':
                config_cli = optarg;
                break;

            case 'n':
                no_color = true;
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (!apg_file || *apg_file == '\0') {
        std::fprintf(stderr, "No apg file specified in the parameter.\n");
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    std::string config_path = apg::config::kDefaultConfigPath;
    bool config_required = false;
    if (config_cli) {
        config_path = config_cli;
        config_required = true;
    } else if (const char *env = std::getenv(apg::config::kConfigPathEnv); env && *env) {
        config_path = env;
        config_required = true;
    }

    apg::config::AppConfigFromFile cfg;
    if (auto r = cfg.LoadFile(config_path); !r.is_ok()) {
        if (r.err == ENOENT && !config_required) {
            cfg.Reset();
        } else {
            std::fprintf(stderr, "ERROR: cannot load config: %s\n", r.msg.c_str());
            return kExitUsage;
        }
    }

    if (cfg.log_level) {
        auto lvl = apg::ParseLogLevel(*cfg.log_level);
        if (!lvl) {
            std::fprintf(stderr, "ERROR: invalid LogLevel in %s: %s\n",
                         config_path.c_str(), cfg.log_level->c_str());
            return kExitUsage;
        }
        apg::Logger::Instance().SetLevel(*lvl);
    }
    if (verbose) {
        apg::Logger::Instance().SetLevel(apg::LogLevel::Debug);
    }

    apg::FormatVersion version = apg::FormatVersion::V1;
    if (version_cli) {
        version = *version_cli;
    } else if (cfg.format_version) {
        auto v = apg::ParseFormatVersion(*cfg.format_version);
        if (!v) {
            std::fprintf(stderr, "ERROR: invalid FormatVersion in %s: %d\n",
                         config_path.c_str(), *cfg.format_version);
            return kExitUsage;
        }
        version = *v;
    }

    apg::PackageChecker::Options opt{};
    if (cfg.max_entry_bytes) opt.extract.max_entry_bytes = *cfg.max_entry_bytes;
    if (cfg.max_total_bytes) opt.extract.max_total_bytes = *cfg.max_total_bytes;
    opt.validate.max_metadata_bytes =
        cfg.max_metadata_bytes ? *cfg.max_metadata_bytes : opt.extract.max_entry_bytes;
    if (cfg.scratch_base_dir) opt.scratch_base_dir = *cfg.scratch_base_dir;

    const bool want_color = !no_color && cfg.color.value_or(true);
    const apg::ConsoleReporter reporter(
        stdout, stderr, apg::ConsoleReporter::ShouldUseColor(stdout, want_color));

    apg::PackageChecker checker(std::move(opt));
    const apg::CheckReport report = checker.Run(apg_file, version);
    reporter.Report(report);

    return report.Passed() ? kExitOk : kExitInvalid;
}
