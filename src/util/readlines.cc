#include "readlines.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace {

struct LineParserState {
    explicit LineParserState(const std::string& source)
        : source(source) {
    }

    const std::string& source;
    std::size_t pos = 0;

    bool
    done() const {
        return pos >= source.size();
    }
};

bool
getline(LineParserState& s, std::string& line) {
    line.clear();
    if (s.done()) {
        return false;
    }

    auto end = s.source.find('\n', s.pos);
    const bool terminated = end != std::string::npos;
    if (!terminated) {
        end = s.source.size();
    }

    line.assign(s.source, s.pos, end - s.pos);
    if (terminated && !line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    s.pos = end + 1;
    return true;
}

}  // namespace

std::vector<std::string>
patchy::split_lines(const std::string& text) {
    std::vector<std::string> lines;
    LineParserState state{text};

    std::string line;
    while (getline(state, line)) {
        lines.push_back(std::move(line));
    }

    return lines;
}

std::string
patchy::join_lines(const std::vector<std::string>& lines) {
    std::size_t length = lines.empty() ? 0 : lines.size() - 1;
    for (const auto& line : lines) {
        length += line.size();
    }

    std::string text;
    text.reserve(length);
    for (std::size_t i = 0; i < lines.size(); i++) {
        if (i > 0) {
            text.push_back('\n');
        }
        text.append(lines[i]);
    }
    return text;
}

bool
patchy::read_file(const std::string& path, std::string& out_text) {
    FILE* stream = fopen(path.c_str(), "rb");
    if (!stream) {
        fmt::print(stderr, "Failed to open file '{}': {}\n", path, strerror(errno));
        return false;
    }

    std::string text;
    char buffer[4096];
    std::size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), stream)) > 0) {
        text.append(buffer, n);
    }

    if (ferror(stream)) {
        fmt::print(stderr, "Failed to read file '{}'\n", path);
        fclose(stream);
        return false;
    }

    fclose(stream);
    out_text = std::move(text);
    return true;
}

bool
patchy::write_file(const std::string& path, const std::string& text) {
    FILE* stream = fopen(path.c_str(), "wb");
    if (!stream) {
        fmt::print(stderr, "Failed to open '{}' for writing.\n", path);
        fmt::print(stderr, "   errno ({}) = {}\n", errno, strerror(errno));
        return false;
    }

    bool ok = fwrite(text.data(), 1, text.size(), stream) == text.size();
    if (fclose(stream) != 0) {
        ok = false;
    }

    if (!ok) {
        fmt::print(stderr, "Failed to write file '{}'\n", path);
    }
    return ok;
}
