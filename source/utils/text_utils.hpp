#ifndef SIMDECK_TEXT_UTILS_HPP
#define SIMDECK_TEXT_UTILS_HPP

// String helpers shared by the command executor and the tool output parsers.

#include <string>
#include <vector>

namespace text_utils {

// Replaces invalid UTF-8 sequences (broken multibyte, invalid bytes) with U+FFFD
// and drops NUL bytes. Tool output must pass through here before it reaches JSON.
void sanitize_utf8(std::string &text);

// Strips leading and trailing whitespace (spaces, tabs, CR, LF).
std::string trim(const std::string &text);

// Splits on '\n', trimming each line. Empty lines are kept unless skip_empty.
std::vector<std::string> split_lines(const std::string &text, bool skip_empty = true);

// Splits on runs of whitespace.
std::vector<std::string> split_whitespace(const std::string &text);

std::string to_lower(const std::string &text);

bool starts_with(const std::string &text, const std::string &prefix);

// Replaces every occurrence of `from` with `to`.
std::string replace_all(const std::string &text, const std::string &from, const std::string &to);

} // namespace text_utils

#endif // SIMDECK_TEXT_UTILS_HPP
