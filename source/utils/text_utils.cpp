#include "utils/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>

namespace text_utils {

namespace {

const unsigned char kReplacementUtf8[] = { 0xEF, 0xBF, 0xBD }; // U+FFFD in UTF-8
constexpr size_t kReplacementLength = sizeof(kReplacementUtf8);

// Returns number of bytes that form a valid UTF-8 lead byte (1-4), or 0 if invalid.
unsigned char utf8_lead_length(unsigned char byte) {
    if (byte < 0x80u) {
        return 1;
    }
    if (byte >= 0xC2u && byte <= 0xDFu) {
        return 2;
    }
    if (byte >= 0xE0u && byte <= 0xEFu) {
        return 3;
    }
    if (byte >= 0xF0u && byte <= 0xF4u) {
        return 4;
    }
    return 0;
}

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0u) == 0x80u;
}

bool is_space(char character) {
    return std::isspace(static_cast<unsigned char>(character)) != 0;
}

} // namespace

void sanitize_utf8(std::string &text) {
    std::string result;
    result.reserve(text.size());

    const unsigned char *pointer = reinterpret_cast<const unsigned char *>(text.data());
    const unsigned char *end = pointer + text.size();

    while (pointer < end) {
        unsigned char lead = *pointer;
        if (lead == 0x00u) {
            ++pointer;
            continue;
        }

        unsigned char length = utf8_lead_length(lead);
        bool valid = (length != 0) && (pointer + length <= end);
        for (unsigned char index = 1; valid && index < length; ++index) {
            valid = is_continuation(pointer[index]);
        }

        if (!valid) {
            result.append(reinterpret_cast<const char *>(kReplacementUtf8), kReplacementLength);
            ++pointer;
            continue;
        }

        result.append(reinterpret_cast<const char *>(pointer), static_cast<size_t>(length));
        pointer += length;
    }

    text = std::move(result);
}

std::string trim(const std::string &text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(text[begin])) {
        ++begin;
    }
    while (end > begin && is_space(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::vector<std::string> split_lines(const std::string &text, bool skip_empty) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        std::string trimmed = trim(line);
        if (skip_empty && trimmed.empty()) {
            continue;
        }
        lines.push_back(trimmed);
    }
    return lines;
}

std::vector<std::string> split_whitespace(const std::string &text) {
    std::vector<std::string> parts;
    std::istringstream stream(text);
    std::string part;
    while (stream >> part) {
        parts.push_back(part);
    }
    return parts;
}

std::string to_lower(const std::string &text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

bool starts_with(const std::string &text, const std::string &prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

std::string replace_all(const std::string &text, const std::string &from, const std::string &to) {
    if (from.empty()) {
        return text;
    }
    std::string result;
    size_t position = 0;
    while (true) {
        size_t found = text.find(from, position);
        if (found == std::string::npos) {
            result.append(text, position, std::string::npos);
            break;
        }
        result.append(text, position, found - position);
        result += to;
        position = found + from.size();
    }
    return result;
}

} // namespace text_utils
