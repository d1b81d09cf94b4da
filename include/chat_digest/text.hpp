#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chat_digest/message.hpp"

namespace chat_digest {

// Removes http(s):// and www. links, replacing each with a single space.
std::string strip_urls(std::string_view text);

// Splits on whitespace, case-folds and strips leading/trailing punctuation from each token.
// URLs are removed first. Never returns empty tokens.
std::vector<std::string> tokenize(std::string_view text);

bool is_stop_word(std::string_view token);
std::vector<std::string> remove_stop_words(const std::vector<std::string>& tokens);

bool is_numeric_token(std::string_view token);

// Each returned string is one complete emoji sequence: a flag pair, a keycap, or a pictograph
// with its skin tone modifier, variation selector and any ZWJ-joined continuation. A skin tone
// modifier on its own is not an emoji.
std::vector<std::string> extract_emojis(std::string_view text);

// "<Media omitted>", "<attached: ...>", "image omitted" and similar export placeholders.
bool is_media_placeholder(std::string_view body);

// Hex tint for one of the twelve recognised colour words.
std::optional<std::string_view> color_hex_for_word(std::string_view word);

// Shared, read-only token view of one message carrying text.
struct TokenizedMessage {
  const Message* source = nullptr;
  std::vector<std::string> words;     // unfiltered
  std::vector<std::string> filtered;  // stop words removed
  std::vector<std::string> emojis;
  bool media_placeholder = false;
};

// Tokenizes every Normal message once. Media placeholders keep an entry with no words so
// their senders still appear in per-person statistics.
std::vector<TokenizedMessage> tokenize_messages(const std::vector<Message>& messages);

}  // namespace chat_digest
