#include "unified.hpp"

#include <fmt/format.h>

using namespace patchy;

namespace {

std::string
format_file_header(const char* marker, const FileInfo& file) {
    if (file.meta) {
        return fmt::format("{} {}\t{}\n", marker, file.path, *file.meta);
    }
    return fmt::format("{} {}\n", marker, file.path);
}

}  // namespace

std::vector<std::string>
patchy::unified_patch_render(const Patch& patch) {
    std::vector<std::string> udiff;

    udiff.push_back(format_file_header("---", patch.old_file));
    udiff.push_back(format_file_header("+++", patch.new_file));

    auto format_change = [](const Range& range) -> std::string {
        if (range.count == 1)
            return fmt::format("{}", range.start);
        return fmt::format("{},{}", range.start, range.count);
    };

    for (const auto& hunk : patch.hunks) {
        if (hunk.range_hint.empty()) {
            udiff.push_back(
                fmt::format("@@ -{} +{} @@\n", format_change(hunk.old_range), format_change(hunk.new_range)));
        } else {
            udiff.push_back(fmt::format("@@ -{} +{} @@ {}\n", format_change(hunk.old_range),
                                        format_change(hunk.new_range), hunk.range_hint));
        }

        for (const auto& line : hunk.lines) {
            std::string op = " ";
            if (line.type == LineType::Add)
                op = "+";
            else if (line.type == LineType::Remove)
                op = "-";

            udiff.push_back(fmt::format("{:1}{}\n", op, line.text));
        }
    }

    if (!patch.end_newline && !patch.hunks.empty()) {
        udiff.push_back("\\ No newline at end of file\n");
    }

    return udiff;
}

std::string
patchy::unified_patch_text(const Patch& patch) {
    std::string text;
    for (const auto& line : unified_patch_render(patch)) {
        text.append(line);
    }
    return text;
}
