#include "peel/archive_processor.hpp"
#include "peel/format_classifier.hpp"
#include "peel/tool_registry.hpp"
#include "system/signals.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <getopt.h>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

constexpr const char *kVersion = "1.0.0";

enum LongOnly {
    kOptOneEntry = 256,
    kOptListExtensions,
    kOptVersion,
};

void PrintUsage(const char *argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [options] archive [archive ...]\n"
        "\n"
        "Extracts each archive into its own directory, whatever its format.\n"
        "\n"
        "Options:\n"
        "  -r, --recursive             Extract archives found inside the output too\n"
        "      --one, --one-entry=WHAT Single differently-named entry: inside, rename or here\n"
        "  -o, --overwrite             Reuse the output name, merging and replacing\n"
        "  -f, --flat, --no-directory  Extract into the current directory\n"
        "  -n, --noninteractive        Never ask; use safe defaults\n"
        "  -l, -t, --list, --table     List archive contents instead of extracting\n"
        "  -m, --metadata              Extract package metadata (deb, gem)\n"
        "  -p, --password=PASSWORD     Password for encrypted archives\n"
        "  -q, --quiet                 Less output (repeatable)\n"
        "  -v, --verbose               More output (repeatable)\n"
        "      --list-extensions       Print every recognized file name suffix\n"
        "      --version               Print the version\n"
        "  -h, --help                  Show this help\n",
        argv0);
}

void PrintExtensions() {
    for (const auto &rule : peel::FormatClassifier::SuffixRules()) {
        if (rule.layers.empty()) {
            std::printf("%s\t(identified by content)\n", rule.suffix.c_str());
        } else {
            std::printf("%s\t%s\n", rule.suffix.c_str(), peel::DescribeLayers(rule.layers).c_str());
        }
    }
}

struct CliFlags {
    bool recursive = false;
    bool overwrite = false;
    bool flat = false;
    bool noninteractive = false;
    bool list = false;
    bool metadata = false;
    int verbosity_delta = 0;
    const char *one_entry = nullptr;
    const char *password = nullptr;
};

void ApplyConfig(const peel::config::PeelConfigFromFile &cfg, peel::ProcessorOptions &opt,
                 CliFlags &cli, int &verbosity) {
    if (cfg.recursive.value_or(false)) cli.recursive = true;
    if (cfg.noninteractive.value_or(false)) cli.noninteractive = true;
    if (cfg.overwrite.value_or(false)) cli.overwrite = true;
    if (cfg.max_recursion_depth) opt.max_recursion_depth = static_cast<int>(*cfg.max_recursion_depth);
    if (cfg.verbosity) verbosity = *cfg.verbosity;
    if (cfg.downloader) opt.downloader = *cfg.downloader;
    if (cfg.one_entry && !cli.one_entry) {
        auto policy = peel::ParseOneEntryPolicy(*cfg.one_entry);
        if (policy) {
            opt.one_entry = *policy;
        } else {
            LogWarn("config: %s", policy.error().c_str());
        }
    }
}

void PrintSummary(const peel::ExtractionResult &r, int verbosity) {
    if (!r.Failed()) {
        if (verbosity >= 1) {
            for (const auto &p : r.produced) std::printf("%s\n", p.c_str());
        }
        return;
    }
    for (const auto &line : peel::FailureSummary(r, verbosity)) {
        std::fprintf(stderr, "peel: %s\n", line.c_str());
    }
}

} // namespace

int main(int argc, char **argv) {
    peel::InstallSignalHandlers();

    CliFlags cli;

    static option long_opts[] = {
        {"recursive", no_argument, nullptr, 'r'},
        {"one", required_argument, nullptr, kOptOneEntry},
        {"one-entry", required_argument, nullptr, kOptOneEntry},
        {"overwrite", no_argument, nullptr, 'o'},
        {"flat", no_argument, nullptr, 'f'},
        {"no-directory", no_argument, nullptr, 'f'},
        {"noninteractive", no_argument, nullptr, 'n'},
        {"list", no_argument, nullptr, 'l'},
        {"table", no_argument, nullptr, 't'},
        {"metadata", no_argument, nullptr, 'm'},
        {"password", required_argument, nullptr, 'p'},
        {"quiet", no_argument, nullptr, 'q'},
        {"verbose", no_argument, nullptr, 'v'},
        {"list-extensions", no_argument, nullptr, kOptListExtensions},
        {"version", no_argument, nullptr, kOptVersion},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "rofnltmp:qvh", long_opts, &idx)) != -1) {
        switch (c) {
            case 'r': cli.recursive = true; break;
            case 'o': cli.overwrite = true; break;
            case 'f': cli.flat = true; break;
            case 'n': cli.noninteractive = true; break;
            case 'l':
            case 't': cli.list = true; break;
            case 'm': cli.metadata = true; break;
            case 'p': cli.password = optarg; break;
            case 'q': --cli.verbosity_delta; break;
            case 'v': ++cli.verbosity_delta; break;
            case kOptOneEntry: cli.one_entry = optarg; break;

            case kOptListExtensions:
                PrintExtensions();
                return 0;

            case kOptVersion:
                std::printf("peel %s\n", kVersion);
                return 0;

            case 'h':
                PrintUsage(argv[0]);
                return 0;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    std::vector<std::string> inputs;
    for (int i = optind; i < argc; ++i) inputs.emplace_back(argv[i]);
    if (inputs.empty()) {
        PrintUsage(argv[0]);
        return 2;
    }
    if (cli.list && cli.metadata) {
        std::fprintf(stderr, "peel: --list and --metadata cannot be combined\n");
        return 2;
    }

    peel::ProcessorOptions opt;
    int verbosity = 0;

    const std::string config_path = peel::config::PeelConfigFromFile::DefaultPath();
    std::error_code ec;
    if (!config_path.empty() && std::filesystem::exists(config_path, ec)) {
        peel::config::PeelConfigFromFile cfg;
        if (cfg.LoadFile(config_path)) {
            ApplyConfig(cfg, opt, cli, verbosity);
        }
    }

    verbosity += cli.verbosity_delta;
    peel::Logger::Instance().SetLevel(peel::LogLevelForVerbosity(verbosity));

    if (cli.one_entry) {
        auto policy = peel::ParseOneEntryPolicy(cli.one_entry);
        if (!policy) {
            std::fprintf(stderr, "peel: %s\n", policy.error().c_str());
            return 2;
        }
        opt.one_entry = *policy;
    }

    opt.mode = cli.list ? peel::Mode::List : cli.metadata ? peel::Mode::Metadata : peel::Mode::Extract;
    opt.recursive = cli.recursive;
    opt.overwrite = cli.overwrite;
    opt.flat = cli.flat;
    opt.interactive = !cli.noninteractive && ::isatty(STDIN_FILENO);
    opt.verbosity = verbosity;
    if (cli.password) opt.password = std::string(cli.password);

    peel::ArchiveProcessor processor(opt, peel::ToolAvailability::Instance(), nullptr,
                                     &peel::g_cancel);

    bool failed = false;
    bool first = true;
    for (const auto &input : inputs) {
        peel::ExtractionResult r = processor.Process(input);
        if (opt.mode == peel::Mode::List && !r.Failed()) {
            if (inputs.size() > 1) {
                std::printf("%s%s:\n", first ? "" : "\n", input.c_str());
            }
            for (const auto &name : r.listing) std::printf("%s\n", name.c_str());
            std::fflush(stdout);
            first = false;
        }
        PrintSummary(r, verbosity);
        failed = failed || r.Failed();
        if (r.kind == peel::ErrorKind::Interrupted) break;
    }

    if (peel::g_cancel.load()) return 1;
    return failed ? 1 : 0;
}
