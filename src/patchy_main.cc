#include "config/config.hpp"
#include "output/unified.hpp"
#include "parser/patch_parser.hpp"
#include "patch/applier.hpp"
#include "util/readlines.hpp"

#include <getopt.h>

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <string>

#ifndef PATCHY_VERSION
#define PATCHY_VERSION "unknown"
#endif

#ifndef PATCHY_BUILD_HASH
#define PATCHY_BUILD_HASH "unknown"
#endif

namespace {

enum ExitCode {
    kExitOk = 0,
    kExitApplyFailed = 1,
    kExitUsage = 2,
};

}  // namespace

int
main(int argc, char* argv[]) {
    patchy::ProgramOptions opts;

    auto show_help = [&](const std::string& optional_error_message) {
        std::string help = fmt::format(R"(
Usage: {} [options] patch_file target_file

Apply a unified diff to a file

Options:
    -v, --version                show program version and exit
    -s, --strategy [strategy]    how hunks are located in the target
                                     strict (s)  trust the hunk line numbers
                                     fuzzy  (f)  search for the closest match
                                     auto   (a)  strict, then fuzzy on failure
    -o, --output [file]          write the result to a file instead of stdout
    -i, --in-place               overwrite target_file with the result
    -n, --dry-run                only report whether the patch applies
    -p, --print-patch            print the parsed patch before applying it
    -V, --verbose                report what is being done on stderr
    -h, --help                   show this help
)",
                                       argv[0]);

        help += "\n";
        help += "Config directory:\n    " + patchy::config_get_directory() + "\n\n";

        if (!optional_error_message.empty()) {
            help += optional_error_message;
            help += "\n";
        }
        fmt::print(stderr, "{}", help);
    };

    auto parse_args = [&](int in_argc, char* in_argv[]) {
        static struct option long_options[] = {{"help", no_argument, 0, 'h'},
                                               {"version", no_argument, 0, 'v'},
                                               {"strategy", required_argument, 0, 's'},
                                               {"output", required_argument, 0, 'o'},
                                               {"in-place", no_argument, 0, 'i'},
                                               {"dry-run", no_argument, 0, 'n'},
                                               {"print-patch", no_argument, 0, 'p'},
                                               {"verbose", no_argument, 0, 'V'},
                                               {0, 0, 0, 0}};
        int c = 0, option_index = 0;
        while ((c = getopt_long(in_argc, in_argv, "hvs:o:inpV", long_options, &option_index)) >= 0) {
            switch (c) {
                case 'v':
                    fmt::print("version: {}\n", PATCHY_VERSION);
                    fmt::print("vcs hash: {}\n", PATCHY_BUILD_HASH);
                    exit(kExitOk);
                case 'h':
                    opts.help = true;
                    return true;
                case 's': {
                    opts.strategy = patchy::strategy_from_string(optarg);
                    if (opts.strategy == patchy::ApplyStrategy::kInvalid) {
                        show_help(fmt::format("error: invalid strategy '{}'", optarg));
                        return false;
                    }
                } break;
                case 'o':
                    opts.output_file = optarg;
                    break;
                case 'i':
                    opts.in_place = true;
                    break;
                case 'n':
                    opts.dry_run = true;
                    break;
                case 'p':
                    opts.print_patch = true;
                    break;
                case 'V':
                    opts.verbose = true;
                    break;
                case '?':
                    show_help("error: invalid option");
                    return false;
                default:
                    show_help(fmt::format("error: invalid option: -{}", static_cast<char>(c)));
                    return false;
            }
        }

        if (opts.in_place && !opts.output_file.empty()) {
            show_help("error: -i and -o are mutually exclusive");
            return false;
        }

        int positional_count = in_argc - optind;
        if (positional_count != 2) {
            show_help("error: expected a patch file and a target file");
            return false;
        }

        opts.patch_file = in_argv[optind];
        opts.target_file = in_argv[optind + 1];
        return true;
    };

    // Load the global defaults before we override them with command line args
    if (!patchy::config_apply_options(opts)) {
        fmt::print(stderr, "warning: ignoring invalid configuration\n");
    }

    if (!parse_args(argc, argv)) {
        return kExitUsage;
    }

    if (opts.help) {
        show_help("");
        return kExitOk;
    }

    auto log = [&](const std::string& message) {
        if (opts.verbose) {
            fmt::print(stderr, "patchy: {}\n", message);
        }
    };

    std::string patch_text;
    if (!patchy::read_file(opts.patch_file, patch_text)) {
        return kExitUsage;
    }

    patchy::Patch patch;
    patchy::PatchParseResult parse_result;
    if (!patchy::patch_parse(patch_text, patch, parse_result)) {
        fmt::print(stderr, "error: {}:{}: {}\n", opts.patch_file, parse_result.line_number, parse_result.error);
        return kExitUsage;
    }
    log(fmt::format("parsed {} hunk(s) for '{}'", patch.hunks.size(), patch.new_file.path));

    if (opts.print_patch) {
        fmt::print(stderr, "{}", patchy::unified_patch_text(patch));
    }

    std::string content;
    if (!patchy::read_file(opts.target_file, content)) {
        return kExitUsage;
    }

    log(fmt::format("applying with strategy '{}'", patchy::repr(opts.strategy)));

    std::string output;
    patchy::ApplyResult apply_result;
    if (!patchy::patch_apply_with_strategy(patch, content, opts.strategy, opts.fix_end_newline, output,
                                           apply_result)) {
        fmt::print(stderr, "error: {}: {} ({})\n", opts.target_file, apply_result.error(),
                   patchy::repr(apply_result.strategy_used));
        return kExitApplyFailed;
    }

    if (opts.strategy == patchy::ApplyStrategy::kAuto &&
        apply_result.strategy_used == patchy::ApplyStrategy::kFuzzy) {
        log("strict application failed, applied by content search");
    }

    if (opts.dry_run) {
        log(fmt::format("patch applies cleanly to '{}'", opts.target_file));
        return kExitOk;
    }

    if (opts.in_place) {
        if (!patchy::write_file(opts.target_file, output)) {
            return kExitUsage;
        }
        log(fmt::format("patched '{}'", opts.target_file));
    } else if (!opts.output_file.empty()) {
        if (!patchy::write_file(opts.output_file, output)) {
            return kExitUsage;
        }
        log(fmt::format("wrote '{}'", opts.output_file));
    } else {
        fwrite(output.data(), 1, output.size(), stdout);
    }

    return kExitOk;
}
