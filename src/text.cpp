#include "chat_digest/text.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_set>
#include <utility>

#include "chat_digest/utf8.hpp"

namespace chat_digest {
namespace {

constexpr char32_t kZeroWidthJoiner = 0x200D;
constexpr char32_t kVariationSelector16 = 0xFE0F;
constexpr char32_t kCombiningKeycap = 0x20E3;
constexpr char32_t kRightSingleQuote = 0x2019;

constexpr std::array<std::pair<std::string_view, std::string_view>, 12> kColorWords{{
    {"blue", "#64d8ff"},
    {"pink", "#ff7edb"},
    {"purple", "#8c7bff"},
    {"mint", "#7cf9c0"},
    {"orange", "#ffb347"},
    {"red", "#ff6b6b"},
    {"yellow", "#ffd166"},
    {"green", "#06d6a0"},
    {"teal", "#118ab2"},
    {"magenta", "#ef476f"},
    {"gold", "#f2c94c"},
    {"lavender", "#b39ddb"},
}};

const std::unordered_set<std::string_view>& stop_words() {
  static const std::unordered_set<std::string_view> kStopWords = {
      // English function words
      "i", "me", "my", "myself", "we", "our", "ours", "ourselves", "you", "you're", "you've",
      "you'll", "you'd", "your", "yours", "yourself", "yourselves", "he", "him", "his",
      "himself", "she", "she's", "her", "hers", "herself", "it", "it's", "its", "itself",
      "they", "them", "their", "theirs", "themselves", "what", "which", "who", "whom", "this",
      "that", "that'll", "these", "those", "am", "is", "are", "was", "were", "be", "been",
      "being", "have", "has", "had", "having", "do", "does", "did", "doing", "a", "an", "the",
      "and", "but", "if", "or", "because", "as", "until", "while", "of", "at", "by", "for",
      "with", "about", "against", "between", "into", "through", "during", "before", "after",
      "above", "below", "to", "from", "up", "down", "in", "out", "on", "off", "over", "under",
      "again", "further", "then", "once", "here", "there", "when", "where", "why", "how", "all",
      "any", "both", "each", "few", "more", "most", "other", "some", "such", "no", "nor", "not",
      "only", "own", "same", "so", "than", "too", "very", "s", "t", "can", "will", "just",
      "don", "don't", "should", "should've", "now", "d", "ll", "m", "o", "re", "ve", "y", "ain",
      "aren", "aren't", "couldn", "couldn't", "didn", "didn't", "doesn", "doesn't", "hadn",
      "hadn't", "hasn", "hasn't", "haven", "haven't", "isn", "isn't", "ma", "mightn",
      "mightn't", "mustn", "mustn't", "needn", "needn't", "shan", "shan't", "shouldn",
      "shouldn't", "wasn", "wasn't", "weren", "weren't", "won", "won't", "wouldn", "wouldn't",
      "i'm", "im", "i'll", "i've", "i'd", "we're", "they're", "he's", "let's", "there's",
      "what's", "can't", "cant", "dont",
      // export artefacts
      "media", "omitted", "attached", "audio", "image", "bild", "medien", "ausgeschlossen",
      "weggelassen", "ommited", "omesso", "edited", "message", "missed", "voice", "call",
      "location", "deleted", "ich", "du", "wir"};
  return kStopWords;
}

bool is_regional_indicator(char32_t cp) {
  return cp >= 0x1F1E6 && cp <= 0x1F1FF;
}

bool is_skin_tone(char32_t cp) {
  return cp >= 0x1F3FB && cp <= 0x1F3FF;
}

bool is_keycap_base(char32_t cp) {
  return (cp >= U'0' && cp <= U'9') || cp == U'#' || cp == U'*';
}

bool is_emoji_base(char32_t cp) {
  if (is_skin_tone(cp)) {
    return false;
  }
  if ((cp >= 0x1F300 && cp <= 0x1FAFF) || (cp >= 0x2600 && cp <= 0x27BF) ||
      (cp >= 0x2300 && cp <= 0x23FF) || (cp >= 0x2B50 && cp <= 0x2B55) ||
      (cp >= 0x25FB && cp <= 0x25FE) || (cp >= 0x2194 && cp <= 0x2199)) {
    return true;
  }
  switch (cp) {
    case 0x00A9:
    case 0x00AE:
    case 0x203C:
    case 0x2049:
    case 0x2122:
    case 0x2139:
    case 0x21A9:
    case 0x21AA:
    case 0x24C2:
    case 0x25AA:
    case 0x25AB:
    case 0x25B6:
    case 0x25C0:
    case 0x2934:
    case 0x2935:
    case 0x3030:
    case 0x303D:
    case 0x3297:
    case 0x3299:
      return true;
    default:
      return false;
  }
}

bool is_zwj_continuation(char32_t cp) {
  return (cp >= 0x1F300 && cp <= 0x1FAFF) || (cp >= 0x2600 && cp <= 0x27BF);
}

bool matches_prefix_ci(std::string_view text, std::size_t pos, std::string_view prefix) {
  if (pos + prefix.size() > text.size()) {
    return false;
  }
  for (std::size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(text[pos + i])) != prefix[i]) {
      return false;
    }
  }
  return true;
}

bool ends_with(std::string_view text, std::string_view suffix) {
  return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

}  // namespace

std::string strip_urls(std::string_view text) {
  std::string out;
  out.reserve(text.size());

  std::size_t i = 0;
  while (i < text.size()) {
    const bool at_boundary =
        i == 0 || std::isalnum(static_cast<unsigned char>(text[i - 1])) == 0;
    if (at_boundary && (matches_prefix_ci(text, i, "http://") ||
                        matches_prefix_ci(text, i, "https://") ||
                        matches_prefix_ci(text, i, "www."))) {
      while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) == 0) {
        ++i;
      }
      out.push_back(' ');
      continue;
    }
    out.push_back(text[i]);
    ++i;
  }
  return out;
}

std::vector<std::string> tokenize(std::string_view text) {
  const std::vector<char32_t> codepoints = utf8::decode(strip_urls(text));

  std::vector<std::string> tokens;
  std::size_t i = 0;
  while (i < codepoints.size()) {
    while (i < codepoints.size() && utf8::is_space(codepoints[i])) {
      ++i;
    }
    std::size_t end = i;
    while (end < codepoints.size() && !utf8::is_space(codepoints[end])) {
      ++end;
    }

    std::size_t first = i;
    std::size_t last = end;
    while (first < last && !utf8::is_alphanumeric(codepoints[first])) {
      ++first;
    }
    while (last > first && !utf8::is_alphanumeric(codepoints[last - 1])) {
      --last;
    }
    if (first < last) {
      std::string token;
      token.reserve(last - first);
      for (std::size_t k = first; k < last; ++k) {
        const char32_t cp = codepoints[k] == kRightSingleQuote ? U'\'' : codepoints[k];
        utf8::append(token, utf8::fold_case(cp));
      }
      tokens.push_back(std::move(token));
    }
    i = end;
  }
  return tokens;
}

bool is_stop_word(std::string_view token) {
  return stop_words().count(token) > 0;
}

std::vector<std::string> remove_stop_words(const std::vector<std::string>& tokens) {
  std::vector<std::string> out;
  out.reserve(tokens.size());
  for (const std::string& token : tokens) {
    if (!is_stop_word(token)) {
      out.push_back(token);
    }
  }
  return out;
}

bool is_numeric_token(std::string_view token) {
  return !token.empty() && std::all_of(token.begin(), token.end(), [](unsigned char ch) {
    return std::isdigit(ch) != 0;
  });
}

std::vector<std::string> extract_emojis(std::string_view text) {
  std::vector<std::string> out;

  bool may_contain_emoji = false;
  for (const unsigned char ch : text) {
    if (ch >= 0xC2) {
      may_contain_emoji = true;
      break;
    }
  }
  if (!may_contain_emoji) {
    return out;
  }

  const std::vector<char32_t> cps = utf8::decode(text);
  const std::size_t n = cps.size();
  std::size_t i = 0;
  while (i < n) {
    if (is_regional_indicator(cps[i]) && i + 1 < n && is_regional_indicator(cps[i + 1])) {
      out.push_back(utf8::encode(&cps[i], &cps[i] + 2));
      i += 2;
      continue;
    }
    if (is_keycap_base(cps[i])) {
      std::size_t j = i + 1;
      if (j < n && cps[j] == kVariationSelector16) ++j;
      if (j < n && cps[j] == kCombiningKeycap) {
        out.push_back(utf8::encode(&cps[i], &cps[i] + (j + 1 - i)));
        i = j + 1;
        continue;
      }
    }
    if (!is_emoji_base(cps[i])) {
      ++i;
      continue;
    }

    std::size_t j = i + 1;
    if (j < n && is_skin_tone(cps[j])) ++j;
    if (j < n && cps[j] == kVariationSelector16) ++j;
    while (j + 1 < n && cps[j] == kZeroWidthJoiner && is_zwj_continuation(cps[j + 1])) {
      j += 2;
      if (j < n && is_skin_tone(cps[j])) ++j;
      if (j < n && cps[j] == kVariationSelector16) ++j;
    }
    out.push_back(utf8::encode(&cps[i], &cps[i] + (j - i)));
    i = j;
  }
  return out;
}

bool is_media_placeholder(std::string_view body) {
  std::string_view view = body;
  while (view.substr(0, 3) == "\xE2\x80\x8E") {
    view.remove_prefix(3);
  }
  while (!view.empty() && std::isspace(static_cast<unsigned char>(view.front())) != 0) {
    view.remove_prefix(1);
  }
  while (!view.empty() && std::isspace(static_cast<unsigned char>(view.back())) != 0) {
    view.remove_suffix(1);
  }
  const std::string text = utf8::to_lower(view);

  if (text == "<media omitted>" || text == "<medien ausgeschlossen>" ||
      text.rfind("<attached:", 0) == 0) {
    return true;
  }
  static constexpr std::array<std::string_view, 7> kOmittedKinds{
      "image omitted", "video omitted", "audio omitted",  "sticker omitted",
      "gif omitted",   "document omitted", "contact card omitted"};
  for (const std::string_view kind : kOmittedKinds) {
    if (ends_with(text, kind)) {
      return true;
    }
  }
  return false;
}

std::optional<std::string_view> color_hex_for_word(std::string_view word) {
  for (const auto& [label, hex] : kColorWords) {
    if (label == word) {
      return hex;
    }
  }
  return std::nullopt;
}

std::vector<TokenizedMessage> tokenize_messages(const std::vector<Message>& messages) {
  std::vector<TokenizedMessage> out;
  out.reserve(messages.size());
  for (const Message& message : messages) {
    if (message.kind != MessageKind::Normal) {
      continue;
    }
    TokenizedMessage tokenized;
    tokenized.source = &message;
    tokenized.media_placeholder = is_media_placeholder(message.body);
    if (!tokenized.media_placeholder) {
      tokenized.words = tokenize(message.body);
      tokenized.filtered = remove_stop_words(tokenized.words);
      tokenized.emojis = extract_emojis(message.body);
    }
    out.push_back(std::move(tokenized));
  }
  return out;
}

}  // namespace chat_digest
