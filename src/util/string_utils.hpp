#pragma once

#include <string>
#include <vector>

namespace StringUtils {
std::vector<std::string> split(const std::string& str, char delimiter);

// Split a command line into words. Whitespace separates words; single and
// double quotes group, backslash escapes the next character. Returns false
// on an unterminated quote.
bool split_args(const std::string& line, std::vector<std::string>& out);

// Join words with a single space.
std::string join(const std::vector<std::string>& words, size_t from = 0);
}
