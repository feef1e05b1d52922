#pragma once

#include <cstdint>
#include <string>

namespace patchy {

enum class ApplyErrorKind {
    None,
    LineOutOfBounds,  // Needed a line past the end of the input
    ContextMismatch,  // Context or removed line differs from the input
    HunkNotFound,     // No window in the text equals the hunk's old block
};

enum class ApplyStrategy {
    kInvalid,
    kStrict,  // Trust the declared line numbers
    kFuzzy,   // Search for the old block closest to the declared start
    kAuto,    // Strict, falling back to fuzzy on any error
};

struct ApplyResult {
    ApplyErrorKind kind = ApplyErrorKind::None;

    // Which strategy produced the output (or the error).
    ApplyStrategy strategy_used = ApplyStrategy::kInvalid;

    // 1-based line in the input the error refers to.
    int64_t line = 0;
    int64_t total_lines = 0;

    std::string expected;
    std::string actual;

    bool
    is_ok() const {
        return kind == ApplyErrorKind::None;
    }

    void
    reset();

    void
    set_line_out_of_bounds(int64_t line, int64_t total_lines);

    void
    set_context_mismatch(int64_t line, const std::string& expected, const std::string& actual);

    void
    set_hunk_not_found();

    std::string
    error() const;
};

std::string
repr(ApplyErrorKind kind);

std::string
repr(ApplyStrategy strategy);

ApplyStrategy
strategy_from_string(const std::string& s);

}  // namespace patchy
