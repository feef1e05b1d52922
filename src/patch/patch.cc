#include "patch.hpp"

using namespace patchy;

std::vector<std::string>
patchy::hunk_old_lines(const Hunk& hunk) {
    std::vector<std::string> lines;
    for (const auto& line : hunk.lines) {
        if (line.type == LineType::Context || line.type == LineType::Remove) {
            lines.push_back(line.text);
        }
    }
    return lines;
}

std::vector<std::string>
patchy::hunk_new_lines(const Hunk& hunk) {
    std::vector<std::string> lines;
    for (const auto& line : hunk.lines) {
        if (line.type == LineType::Context || line.type == LineType::Add) {
            lines.push_back(line.text);
        }
    }
    return lines;
}

std::string
patchy::repr(LineType type) {
    switch (type) {
        case LineType::Context:
            return "Context";
        case LineType::Add:
            return "Add";
        case LineType::Remove:
            return "Remove";
    }
    return "Unknown";
}
