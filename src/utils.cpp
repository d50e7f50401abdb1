#include "utils.hpp"
#include "duckdb/common/exception.hpp"
#include "utf8proc_wrapper.hpp"
#include <sstream>

namespace duckdb {
namespace brkit {

std::string trim(const std::string& str) {
    if (str.empty()) return str;

    size_t start = 0;
    size_t end = str.length() - 1;

    while (start <= end && is_space_char(str[start])) {
        start++;
    }

    while (end > start && is_space_char(str[end])) {
        end--;
    }

    return str.substr(start, end - start + 1);
}

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool is_digit_char(char c) {
    return c >= '0' && c <= '9';
}

bool is_space_char(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string extract_digits(const std::string& str) {
    std::string digits;
    digits.reserve(str.size());
    for (char c : str) {
        if (is_digit_char(c)) {
            digits += c;
        }
    }
    return digits;
}

std::vector<std::string> split_whitespace(const std::string& str) {
    std::vector<std::string> words;
    std::string current_word;

    size_t pos = 0;
    while (pos < str.size()) {
        size_t len;
        int32_t codepoint = utf8_decode(str, pos, len);
        if (codepoint >= 0 && is_unicode_whitespace(codepoint)) {
            if (!current_word.empty()) {
                words.push_back(current_word);
                current_word.clear();
            }
        } else {
            current_word.append(str, pos, len);
        }
        pos += len;
    }

    if (!current_word.empty()) {
        words.push_back(current_word);
    }

    return words;
}

std::string join_strings(const std::vector<std::string>& strings, const std::string& separator) {
    if (strings.empty()) return "";

    std::ostringstream result;
    result << strings[0];

    for (size_t i = 1; i < strings.size(); i++) {
        result << separator << strings[i];
    }

    return result.str();
}

size_t utf8_char_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    // Stray continuation byte: treat as a single unit
    return 1;
}

int32_t utf8_decode(const std::string& str, size_t pos, size_t& length) {
    unsigned char lead = static_cast<unsigned char>(str[pos]);
    length = utf8_char_length(lead);
    if (length == 1) {
        return lead < 0x80 ? static_cast<int32_t>(lead) : -1;
    }
    if (pos + length > str.size()) {
        length = 1;
        return -1;
    }
    for (size_t k = 1; k < length; k++) {
        if ((static_cast<unsigned char>(str[pos + k]) & 0xC0) != 0x80) {
            length = 1;
            return -1;
        }
    }

    int size = 0;
    int32_t codepoint = Utf8Proc::UTF8ToCodepoint(str.data() + pos, size);
    if (codepoint < 0) {
        length = 1;
        return -1;
    }
    return codepoint;
}

void utf8_append(std::string& out, int32_t codepoint) {
    char buffer[4];
    int size = 0;
    if (!Utf8Proc::CodepointToUtf8(codepoint, size, buffer)) {
        throw InternalException("brkit: cannot encode code point %d as UTF-8", codepoint);
    }
    out.append(buffer, static_cast<size_t>(size));
}

// Unicode White_Space property
bool is_unicode_whitespace(int32_t codepoint) {
    if ((codepoint >= 0x09 && codepoint <= 0x0D) || codepoint == 0x20) {
        return true;
    }
    if (codepoint < 0x85) {
        return false;
    }
    switch (codepoint) {
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
        return true;
    default:
        return codepoint >= 0x2000 && codepoint <= 0x200A;
    }
}

} // namespace brkit
} // namespace duckdb
