#include "patch_parser.hpp"

#include "util/readlines.hpp"

#include <fmt/format.h>

#include <cctype>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

using namespace patchy;

void
PatchParseResult::set_error(int64_t in_line_number, const std::string& error_message) {
    ok = false;
    line_number = in_line_number;
    error = error_message;
}

namespace {

// Cursor over a single line of patch text.
struct LineCursor {
    const char* l;

    explicit LineCursor(const std::string& s)
        : l(s.c_str()) {
    }

    bool
    is_eof() const {
        return *l == '\0';
    }

    bool
    try_consume(char v) {
        if (*l == v) {
            l++;
            return true;
        }
        return false;
    }

    bool
    try_consume(const char* v) {
        auto len = strlen(v);
        if (strncmp(l, v, len) == 0) {
            l += len;
            return true;
        }
        return false;
    }

    void
    consume_whitespace() {
        while (*l == ' ' || *l == '\t') {
            l++;
        }
    }

    bool
    read_int(int64_t& value) {
        if (!std::isdigit(static_cast<unsigned char>(*l))) {
            return false;
        }
        value = 0;
        while (std::isdigit(static_cast<unsigned char>(*l))) {
            const int64_t digit = *l - '0';
            if (value > (std::numeric_limits<int64_t>::max() - digit) / 10) {
                return false;
            }
            value = value * 10 + digit;
            l++;
        }
        return true;
    }
};

struct ParserState {
    explicit ParserState(const std::string& text)
        : lines(split_lines(text)) {
    }

    std::vector<std::string> lines;
    std::size_t pos = 0;

    bool
    done() const {
        return pos >= lines.size();
    }

    const std::string&
    current() const {
        return lines[pos];
    }

    int64_t
    line_number() const {
        return static_cast<int64_t>(pos) + 1;
    }
};

bool
starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, strlen(prefix), prefix) == 0;
}

bool
is_old_file_header(const std::string& line) {
    return starts_with(line, "--- ");
}

// "path<TAB>meta" -> FileInfo
FileInfo
parse_file_info(const std::string& rest) {
    FileInfo info;
    auto tab = rest.find('\t');
    if (tab == std::string::npos) {
        info.path = rest;
    } else {
        info.path = rest.substr(0, tab);
        info.meta = rest.substr(tab + 1);
    }
    return info;
}

bool
parse_range(LineCursor& cursor, Range& range) {
    if (!cursor.read_int(range.start)) {
        return false;
    }
    range.count = 1;
    if (cursor.try_consume(',')) {
        if (!cursor.read_int(range.count)) {
            return false;
        }
    }
    return true;
}

// @@ -a[,b] +c[,d] @@[ hint]
bool
parse_hunk_header(const std::string& line, Hunk& hunk) {
    LineCursor cursor{line};
    if (!cursor.try_consume("@@")) {
        return false;
    }
    cursor.consume_whitespace();
    if (!cursor.try_consume('-') || !parse_range(cursor, hunk.old_range)) {
        return false;
    }
    cursor.consume_whitespace();
    if (!cursor.try_consume('+') || !parse_range(cursor, hunk.new_range)) {
        return false;
    }
    cursor.consume_whitespace();
    if (!cursor.try_consume("@@")) {
        return false;
    }
    cursor.try_consume(' ');
    hunk.range_hint = cursor.l;
    return true;
}

bool
parse_hunk_body(ParserState& s, Hunk& hunk, Patch& patch, PatchParseResult& result) {
    int64_t old_seen = 0;
    int64_t new_seen = 0;

    auto handle_no_newline_marker = [&]() {
        // The marker refers to the line before it. Only the resulting text matters.
        if (!hunk.lines.empty() && hunk.lines.back().type != LineType::Remove) {
            patch.end_newline = false;
        }
        s.pos++;
    };

    while (old_seen < hunk.old_range.count || new_seen < hunk.new_range.count) {
        if (s.done()) {
            result.set_error(s.line_number(), "unexpected end of patch inside hunk");
            return false;
        }

        const std::string& line = s.current();
        const char prefix = line.empty() ? ' ' : line[0];
        const std::string text = line.empty() ? "" : line.substr(1);

        switch (prefix) {
            case ' ': {
                if (old_seen >= hunk.old_range.count || new_seen >= hunk.new_range.count) {
                    result.set_error(s.line_number(), "hunk has more lines than its header declares");
                    return false;
                }
                hunk.lines.push_back(Line::Context(text));
                old_seen++;
                new_seen++;
            } break;
            case '-': {
                if (old_seen >= hunk.old_range.count) {
                    result.set_error(s.line_number(), "hunk has more removed lines than its header declares");
                    return false;
                }
                hunk.lines.push_back(Line::Remove(text));
                old_seen++;
            } break;
            case '+': {
                if (new_seen >= hunk.new_range.count) {
                    result.set_error(s.line_number(), "hunk has more added lines than its header declares");
                    return false;
                }
                hunk.lines.push_back(Line::Add(text));
                new_seen++;
            } break;
            case '\\': {
                handle_no_newline_marker();
                continue;
            }
            default: {
                result.set_error(s.line_number(), fmt::format("unexpected line in hunk: '{}'", line));
                return false;
            }
        }
        s.pos++;
    }

    // A marker may follow the final line of the hunk.
    while (!s.done() && starts_with(s.current(), "\\")) {
        handle_no_newline_marker();
    }

    return true;
}

// Parse one file patch starting at the '---' header at s.pos.
bool
parse_file_patch(ParserState& s, Patch& patch, PatchParseResult& result) {
    patch = Patch{};

    patch.old_file = parse_file_info(s.current().substr(4));
    s.pos++;

    if (s.done() || !starts_with(s.current(), "+++ ")) {
        result.set_error(s.line_number(), "expected '+++' header after '---' header");
        return false;
    }
    patch.new_file = parse_file_info(s.current().substr(4));
    s.pos++;

    while (!s.done() && starts_with(s.current(), "@@")) {
        Hunk hunk;
        if (!parse_hunk_header(s.current(), hunk)) {
            result.set_error(s.line_number(), fmt::format("malformed hunk header: '{}'", s.current()));
            return false;
        }
        s.pos++;

        if (!parse_hunk_body(s, hunk, patch, result)) {
            return false;
        }
        patch.hunks.push_back(std::move(hunk));
    }

    if (patch.hunks.empty()) {
        result.set_error(s.line_number(), "file patch has no hunks");
        return false;
    }

    return true;
}

}  // namespace

bool
patchy::patch_parse_multiple(const std::string& text, std::vector<Patch>& patches, PatchParseResult& result) {
    result = PatchParseResult{};
    patches.clear();

    ParserState s{text};
    while (!s.done()) {
        const std::string& line = s.current();
        if (starts_with(line, "@@")) {
            result.set_error(s.line_number(), "hunk without a preceding file header");
            return false;
        }
        if (!is_old_file_header(line)) {
            s.pos++;
            continue;
        }

        Patch patch;
        if (!parse_file_patch(s, patch, result)) {
            return false;
        }
        patches.push_back(std::move(patch));
    }

    if (patches.empty()) {
        result.set_error(1, "no patch found");
        return false;
    }

    return true;
}

bool
patchy::patch_parse(const std::string& text, Patch& patch, PatchParseResult& result) {
    std::vector<Patch> patches;
    if (!patch_parse_multiple(text, patches, result)) {
        return false;
    }

    if (patches.size() != 1) {
        result.set_error(1, fmt::format("expected a single file patch, found {}", patches.size()));
        return false;
    }

    patch = std::move(patches[0]);
    return true;
}
