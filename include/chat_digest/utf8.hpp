#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace chat_digest::utf8 {

inline constexpr char32_t kReplacement = 0xFFFD;

// Malformed sequences decode to U+FFFD; decoding never fails.
std::vector<char32_t> decode(std::string_view data);

void append(std::string& out, char32_t cp);
std::string encode(const char32_t* first, const char32_t* last);

std::size_t length(std::string_view data);

// Simple one-to-one lowercase mapping for Latin, Greek and Cyrillic scripts.
char32_t fold_case(char32_t cp);
std::string to_lower(std::string_view data);

bool is_alphanumeric(char32_t cp);
// ASCII whitespace plus the no-break and narrow no-break spaces WhatsApp puts in timestamps.
bool is_space(char32_t cp);

}  // namespace chat_digest::utf8
