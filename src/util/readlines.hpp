#pragma once

#include <string>
#include <vector>

namespace patchy {

// Split text into lines. The terminating '\n' (or '\r\n') is not part of the
// line. Text ending in '\n' does not produce a trailing empty line; empty text
// produces no lines.
std::vector<std::string>
split_lines(const std::string& text);

// Join lines with a single '\n' between them. No terminator is appended.
std::string
join_lines(const std::vector<std::string>& lines);

bool
read_file(const std::string& path, std::string& out_text);

bool
write_file(const std::string& path, const std::string& text);

}  // namespace patchy
