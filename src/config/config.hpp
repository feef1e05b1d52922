#pragma once

#include "patch/apply_error.hpp"

#include <cstdint>
#include <string>

namespace patchy {

struct ProgramOptions {
    bool help = false;
    bool verbose = false;
    bool dry_run = false;
    bool print_patch = false;
    bool in_place = false;

    ApplyStrategy strategy = ApplyStrategy::kAuto;

    // Give fuzzy output the trailing newline the patch asks for.
    bool fix_end_newline = true;

    std::string patch_file;
    std::string target_file;
    std::string output_file;
};

std::string
config_get_directory();

// Load patchy.conf from the config directory and apply it on top of the
// defaults in `program_options`. A missing file is not an error.
bool
config_apply_options(ProgramOptions& program_options);

// As above, for an explicit file.
bool
config_apply_options_from_file(const std::string& config_path, ProgramOptions& program_options);

}  // namespace patchy
