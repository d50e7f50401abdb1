#pragma once

#include "duckdb.hpp"
#include <string>
#include <vector>
#include <cctype>
#include <algorithm>
#include <cstdint>

namespace duckdb {
namespace brkit {

// String utilities
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);

// Character classification helpers
bool is_digit_char(char c);
bool is_space_char(char c);

// Digit helpers
std::string extract_digits(const std::string& str);

// Whitespace splitting (Unicode White_Space, runs collapse) and joining
std::vector<std::string> split_whitespace(const std::string& str);
std::string join_strings(const std::vector<std::string>& strings, const std::string& separator);

// UTF-8 helpers
size_t utf8_char_length(unsigned char lead);
// Decodes the code point starting at str[pos] and stores its byte length.
// Returns -1 (length 1) for a malformed or truncated sequence.
int32_t utf8_decode(const std::string& str, size_t pos, size_t& length);
void utf8_append(std::string& out, int32_t codepoint);
bool is_unicode_whitespace(int32_t codepoint);

} // namespace brkit
} // namespace duckdb
