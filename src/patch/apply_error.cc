#include "apply_error.hpp"

#include <fmt/format.h>

using namespace patchy;

void
ApplyResult::reset() {
    *this = ApplyResult{};
}

void
ApplyResult::set_line_out_of_bounds(int64_t in_line, int64_t in_total_lines) {
    kind = ApplyErrorKind::LineOutOfBounds;
    line = in_line;
    total_lines = in_total_lines;
    expected.clear();
    actual.clear();
}

void
ApplyResult::set_context_mismatch(int64_t in_line, const std::string& in_expected, const std::string& in_actual) {
    kind = ApplyErrorKind::ContextMismatch;
    line = in_line;
    total_lines = 0;
    expected = in_expected;
    actual = in_actual;
}

void
ApplyResult::set_hunk_not_found() {
    kind = ApplyErrorKind::HunkNotFound;
    line = 0;
    total_lines = 0;
    expected.clear();
    actual.clear();
}

std::string
ApplyResult::error() const {
    switch (kind) {
        case ApplyErrorKind::None:
            return "";
        case ApplyErrorKind::LineOutOfBounds:
            return fmt::format("Line {} is out of bounds (file has {} lines)", line, total_lines);
        case ApplyErrorKind::ContextMismatch:
            return fmt::format("Context mismatch at line {}: expected '{}', got '{}'", line, expected, actual);
        case ApplyErrorKind::HunkNotFound:
            return "Hunk not found";
    }
    return "Unknown error";
}

std::string
patchy::repr(ApplyErrorKind kind) {
    switch (kind) {
        case ApplyErrorKind::None:
            return "None";
        case ApplyErrorKind::LineOutOfBounds:
            return "LineOutOfBounds";
        case ApplyErrorKind::ContextMismatch:
            return "ContextMismatch";
        case ApplyErrorKind::HunkNotFound:
            return "HunkNotFound";
    }
    return "Unknown";
}

std::string
patchy::repr(ApplyStrategy strategy) {
    switch (strategy) {
        case ApplyStrategy::kStrict:
            return "strict";
        case ApplyStrategy::kFuzzy:
            return "fuzzy";
        case ApplyStrategy::kAuto:
            return "auto";
        case ApplyStrategy::kInvalid:
        default:
            return "invalid";
    }
}

ApplyStrategy
patchy::strategy_from_string(const std::string& s) {
    if (s == "a" || s == "auto" || s == "default")
        return ApplyStrategy::kAuto;
    else if (s == "s" || s == "strict")
        return ApplyStrategy::kStrict;
    else if (s == "f" || s == "fuzzy")
        return ApplyStrategy::kFuzzy;
    return ApplyStrategy::kInvalid;
}
