#pragma once

/*
    Apply a parsed Patch to a block of text.

    patch_apply trusts the line numbers in the hunk headers and verifies every
    context and removed line at its declared position.

    patch_find_replace_apply ignores the declared position except as a hint:
    it looks for every place in the text where the hunk's old block occurs and
    replaces the one closest to the declared start.

    Both are all-or-nothing: on failure `out` is not touched and `result`
    describes the first problem found.
*/

#include "patch/apply_error.hpp"
#include "patch/patch.hpp"

#include <string>

namespace patchy {

bool
patch_apply(const Patch& patch, const std::string& content, std::string& out, ApplyResult& result);

bool
patch_find_replace_apply(const Patch& patch, const std::string& content, std::string& out, ApplyResult& result);

// Strict, fuzzy, or strict with a fuzzy fallback. When `fix_end_newline` is
// set, fuzzy output is terminated the way patch_apply terminates its output.
// Returns false without an error kind for ApplyStrategy::kInvalid.
bool
patch_apply_with_strategy(const Patch& patch,
                          const std::string& content,
                          ApplyStrategy strategy,
                          bool fix_end_newline,
                          std::string& out,
                          ApplyResult& result);

}  // namespace patchy
