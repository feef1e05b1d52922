#pragma once

/*
    Unified diff parser.

    Turns the text of a unified diff into Patch values:

        --- old.txt<TAB>2020-01-01 10:00:00
        +++ new.txt<TAB>2020-01-02 10:00:00
        @@ -1,3 +1,3 @@ optional hint
         line 1
        -line 2
        +new line 2
         line 3

    Anything before the first '---' header of a file (e.g. 'diff --git' or
    'index' lines) is skipped. Hunk bodies are read until the line counts in
    the hunk header are satisfied.
*/

#include "patch/patch.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace patchy {

struct PatchParseResult {
    bool ok = true;

    // 1-based line in the patch text where parsing failed.
    int64_t line_number = 0;
    std::string error;

    bool
    is_ok() const {
        return ok;
    }

    void
    set_error(int64_t line_number, const std::string& error_message);
};

// Parse text holding exactly one file patch.
bool
patch_parse(const std::string& text, Patch& patch, PatchParseResult& result);

// Parse text holding one or more file patches.
bool
patch_parse_multiple(const std::string& text, std::vector<Patch>& patches, PatchParseResult& result);

}  // namespace patchy
