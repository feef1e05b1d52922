#include "applier.hpp"

#include "util/hash.hpp"
#include "util/readlines.hpp"

#include <fmt/format.h>
#include <gsl/span>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

//#define LOCAL_DEBUG

using namespace patchy;

namespace {

// Check the input line a Context or Remove line refers to.
bool
verify_old_line(const std::vector<std::string>& lines,
                std::size_t index,
                const std::string& expected,
                ApplyResult& result) {
    if (index >= lines.size()) {
        result.set_line_out_of_bounds(static_cast<int64_t>(index) + 1, static_cast<int64_t>(lines.size()));
        return false;
    }
    if (lines[index] != expected) {
        result.set_context_mismatch(static_cast<int64_t>(index) + 1, expected, lines[index]);
        return false;
    }
    return true;
}

struct HashedLines {
    std::vector<uint32_t> hashes;

    explicit HashedLines(gsl::span<const std::string> lines) {
        hashes.reserve(lines.size());
        for (const auto& line : lines) {
            hashes.push_back(hash::hash(line));
        }
    }
};

bool
window_equal(gsl::span<const std::string> window,
             gsl::span<const uint32_t> window_hashes,
             gsl::span<const std::string> block,
             gsl::span<const uint32_t> block_hashes) {
    for (std::size_t i = 0; i < block.size(); i++) {
        if (window_hashes[i] != block_hashes[i]) {
            return false;
        }
    }
    for (std::size_t i = 0; i < block.size(); i++) {
        if (window[i] != block[i]) {
            return false;
        }
    }
    return true;
}

// Find the occurrence of `block` in `lines` whose start index is closest to
// `target`. On equal distance the lowest index wins.
std::optional<std::size_t>
find_nearest_block(const std::vector<std::string>& lines, const std::vector<std::string>& block, int64_t target) {
    const int64_t anchor = std::max<int64_t>(target, 0);

    if (block.empty()) {
        return static_cast<std::size_t>(std::min<int64_t>(anchor, static_cast<int64_t>(lines.size())));
    }

    if (block.size() > lines.size()) {
        return std::nullopt;
    }

    const gsl::span<const std::string> line_span{lines};
    const gsl::span<const std::string> block_span{block};

    HashedLines line_hashes{line_span};
    HashedLines block_hashes{block_span};
    const gsl::span<const uint32_t> line_hash_span{line_hashes.hashes};

    std::optional<std::size_t> best_index;
    int64_t best_distance = 0;

    const std::size_t last = lines.size() - block.size();
    for (std::size_t i = 0; i <= last; i++) {
        auto window = line_span.subspan(i, block.size());
        auto window_hashes = line_hash_span.subspan(i, block.size());
        if (!window_equal(window, window_hashes, block_span, block_hashes.hashes)) {
            continue;
        }

        const int64_t index = static_cast<int64_t>(i);
        const int64_t distance = index >= anchor ? index - anchor : anchor - index;

#ifdef LOCAL_DEBUG
        fmt::print("candidate at {} (target {}, distance {})\n", i, anchor, distance);
#endif

        if (!best_index || distance < best_distance) {
            best_index = i;
            best_distance = distance;
        }
    }

    return best_index;
}

// Join output lines, terminating non-empty text when the patch wants it.
std::string
join_output(const std::vector<std::string>& lines, bool end_newline) {
    std::string text = join_lines(lines);
    if (!text.empty() && end_newline) {
        text.push_back('\n');
    }
    return text;
}

// Apply every hunk to `working` in order, each against the already edited lines.
bool
find_replace_lines(const Patch& patch, std::vector<std::string>& working, ApplyResult& result) {
    for (const auto& hunk : patch.hunks) {
        const std::vector<std::string> old_lines = hunk_old_lines(hunk);
        const std::vector<std::string> new_lines = hunk_new_lines(hunk);

        // old_range.start is used as a 0-based anchor here.
        auto best_index = find_nearest_block(working, old_lines, hunk.old_range.start);
        if (!best_index) {
#ifdef LOCAL_DEBUG
            fmt::print("no match for hunk at {}\n", hunk.old_range.start);
#endif
            result.set_hunk_not_found();
            return false;
        }

        auto first = working.begin() + static_cast<std::ptrdiff_t>(*best_index);
        auto erase_end = working.erase(first, first + static_cast<std::ptrdiff_t>(old_lines.size()));
        working.insert(erase_end, new_lines.begin(), new_lines.end());
    }
    return true;
}

}  // namespace

bool
patchy::patch_apply(const Patch& patch, const std::string& content, std::string& out, ApplyResult& result) {
    result.reset();
    result.strategy_used = ApplyStrategy::kStrict;

    const std::vector<std::string> lines = split_lines(content);
    const int64_t total_lines = static_cast<int64_t>(lines.size());

    std::vector<std::string> output;
    output.reserve(lines.size());

    std::size_t current_line = 0;

    for (const auto& hunk : patch.hunks) {
        const std::size_t start = hunk.old_range.start > 0 ? static_cast<std::size_t>(hunk.old_range.start - 1) : 0;

        // Copy the unchanged lines before the hunk
        while (current_line < start) {
            if (current_line >= lines.size()) {
                result.set_line_out_of_bounds(static_cast<int64_t>(current_line) + 1, total_lines);
                return false;
            }
            output.push_back(lines[current_line]);
            current_line++;
        }

        std::size_t hunk_old_line = current_line;
        for (const auto& line : hunk.lines) {
            switch (line.type) {
                case LineType::Context: {
                    if (!verify_old_line(lines, hunk_old_line, line.text, result)) {
                        return false;
                    }
                    output.push_back(line.text);
                    hunk_old_line++;
                } break;
                case LineType::Add: {
                    output.push_back(line.text);
                } break;
                case LineType::Remove: {
                    if (!verify_old_line(lines, hunk_old_line, line.text, result)) {
                        return false;
                    }
                    hunk_old_line++;
                } break;
            }
        }
        current_line = hunk_old_line;
    }

    // Everything after the last hunk
    while (current_line < lines.size()) {
        output.push_back(lines[current_line]);
        current_line++;
    }

    out = join_output(output, patch.end_newline);
    return true;
}

bool
patchy::patch_find_replace_apply(const Patch& patch,
                                 const std::string& content,
                                 std::string& out,
                                 ApplyResult& result) {
    result.reset();
    result.strategy_used = ApplyStrategy::kFuzzy;

    std::vector<std::string> working = split_lines(content);
    if (!find_replace_lines(patch, working, result)) {
        return false;
    }

    out = join_lines(working);
    return true;
}

bool
patchy::patch_apply_with_strategy(const Patch& patch,
                                  const std::string& content,
                                  ApplyStrategy strategy,
                                  bool fix_end_newline,
                                  std::string& out,
                                  ApplyResult& result) {
    auto fuzzy = [&]() {
        result.reset();
        result.strategy_used = ApplyStrategy::kFuzzy;

        std::vector<std::string> working = split_lines(content);
        if (!find_replace_lines(patch, working, result)) {
            return false;
        }

        if (fix_end_newline) {
            out = join_output(working, patch.end_newline);
        } else {
            out = join_lines(working);
        }
        return true;
    };

    switch (strategy) {
        case ApplyStrategy::kStrict:
            return patch_apply(patch, content, out, result);
        case ApplyStrategy::kFuzzy:
            return fuzzy();
        case ApplyStrategy::kAuto: {
            if (patch_apply(patch, content, out, result)) {
                return true;
            }
            return fuzzy();
        }
        case ApplyStrategy::kInvalid:
            /* fall-through */
        default:
            break;
    }

    result.reset();
    return false;
}
