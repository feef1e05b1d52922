#pragma once

/*
    In-memory model of a single-file unified diff.

    A Patch is built by the parser (or by hand) and is only ever read by the
    appliers. Line text never includes the line terminator.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace patchy {

using std::int64_t;

struct Range {
    int64_t start = 0;  // 1-based line number
    int64_t count = 0;
};

enum class LineType {
    Context,
    Add,
    Remove,
};

struct Line {
    static Line
    Context(const std::string& text) {
        return Line{LineType::Context, text};
    }

    static Line
    Add(const std::string& text) {
        return Line{LineType::Add, text};
    }

    static Line
    Remove(const std::string& text) {
        return Line{LineType::Remove, text};
    }

    LineType type;
    std::string text;

    bool
    operator==(const Line& other) const {
        return type == other.type && text == other.text;
    }
};

struct Hunk {
    Range old_range;
    Range new_range;

    // Free text after the closing '@@', usually the enclosing function.
    std::string range_hint;

    std::vector<Line> lines;
};

// Path and optional metadata (typically a timestamp) from a '---'/'+++' header.
struct FileInfo {
    std::string path;
    std::optional<std::string> meta;
};

struct Patch {
    FileInfo old_file;
    FileInfo new_file;

    std::vector<Hunk> hunks;

    // Whether the resulting text ends with a line terminator.
    bool end_newline = true;
};

// The block a hunk expects to find: context and removed lines, in order.
std::vector<std::string>
hunk_old_lines(const Hunk& hunk);

// The block a hunk leaves behind: context and added lines, in order.
std::vector<std::string>
hunk_new_lines(const Hunk& hunk);

std::string
repr(LineType type);

}  // namespace patchy
