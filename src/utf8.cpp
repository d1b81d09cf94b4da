#include "chat_digest/utf8.hpp"

#include <cstdint>

namespace chat_digest::utf8 {
namespace {

bool in_range(char32_t cp, char32_t lo, char32_t hi) {
  return cp >= lo && cp <= hi;
}

}  // namespace

std::vector<char32_t> decode(std::string_view data) {
  std::vector<char32_t> codepoints;
  codepoints.reserve(data.size());

  const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data.data());
  const std::uint8_t* end = p + data.size();

  while (p < end) {
    char32_t cp;

    if (*p < 0x80) {
      cp = *p++;
    } else if ((*p & 0xE0) == 0xC0 && p + 1 < end) {
      const std::uint8_t b1 = *p++;
      const std::uint8_t b2 = *p++;
      if ((b2 & 0xC0) != 0x80) {
        cp = kReplacement;
        --p;
      } else {
        cp = (static_cast<char32_t>(b1 & 0x1F) << 6) | (b2 & 0x3F);
        if (cp < 0x80) cp = kReplacement;
      }
    } else if ((*p & 0xF0) == 0xE0 && p + 2 < end) {
      const std::uint8_t b1 = *p++;
      const std::uint8_t b2 = *p++;
      const std::uint8_t b3 = *p++;
      if ((b2 & 0xC0) != 0x80 || (b3 & 0xC0) != 0x80) {
        cp = kReplacement;
        p -= 2;
      } else {
        cp = (static_cast<char32_t>(b1 & 0x0F) << 12) | (static_cast<char32_t>(b2 & 0x3F) << 6) |
             (b3 & 0x3F);
        if (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF)) cp = kReplacement;
      }
    } else if ((*p & 0xF8) == 0xF0 && p + 3 < end) {
      const std::uint8_t b1 = *p++;
      const std::uint8_t b2 = *p++;
      const std::uint8_t b3 = *p++;
      const std::uint8_t b4 = *p++;
      if ((b2 & 0xC0) != 0x80 || (b3 & 0xC0) != 0x80 || (b4 & 0xC0) != 0x80) {
        cp = kReplacement;
        p -= 3;
      } else {
        cp = (static_cast<char32_t>(b1 & 0x07) << 18) | (static_cast<char32_t>(b2 & 0x3F) << 12) |
             (static_cast<char32_t>(b3 & 0x3F) << 6) | (b4 & 0x3F);
        if (cp < 0x10000 || cp > 0x10FFFF) cp = kReplacement;
      }
    } else {
      cp = kReplacement;
      ++p;
    }

    codepoints.push_back(cp);
  }

  return codepoints;
}

void append(std::string& out, char32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::string encode(const char32_t* first, const char32_t* last) {
  std::string out;
  out.reserve(static_cast<std::size_t>(last - first));
  for (; first != last; ++first) {
    append(out, *first);
  }
  return out;
}

std::size_t length(std::string_view data) {
  std::size_t count = 0;
  for (const unsigned char ch : data) {
    if ((ch & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

char32_t fold_case(char32_t cp) {
  if (cp < 0x80) {
    return (cp >= 'A' && cp <= 'Z') ? cp + 32 : cp;
  }
  if (in_range(cp, 0xC0, 0xDE) && cp != 0xD7) {
    return cp + 32;
  }
  if (cp >= 0x100 && cp <= 0x17F) {
    if (cp == 0x130 || cp == 0x131 || cp == 0x138 || cp == 0x149 || cp == 0x17F) {
      return cp == 0x130 ? U'i' : cp;
    }
    if (cp == 0x178) {
      return 0xFF;
    }
    const bool odd_uppers = in_range(cp, 0x139, 0x148) || in_range(cp, 0x179, 0x17E);
    const bool is_upper = odd_uppers ? (cp % 2 == 1) : (cp % 2 == 0);
    return is_upper ? cp + 1 : cp;
  }
  if (in_range(cp, 0x391, 0x3A9) && cp != 0x3A2) {
    return cp + 32;
  }
  switch (cp) {
    case 0x386:
      return 0x3AC;
    case 0x388:
    case 0x389:
    case 0x38A:
      return cp + 37;
    case 0x38C:
      return 0x3CC;
    case 0x38E:
    case 0x38F:
      return cp + 63;
    default:
      break;
  }
  if (in_range(cp, 0x410, 0x42F)) {
    return cp + 32;
  }
  if (in_range(cp, 0x400, 0x40F)) {
    return cp + 80;
  }
  if ((in_range(cp, 0x460, 0x481) || in_range(cp, 0x48A, 0x4BF)) && cp % 2 == 0) {
    return cp + 1;
  }
  if (in_range(cp, 0x1E00, 0x1EFF) && cp % 2 == 0) {
    return cp + 1;
  }
  if (in_range(cp, 0xFF21, 0xFF3A)) {
    return cp + 32;
  }
  return cp;
}

std::string to_lower(std::string_view data) {
  std::string out;
  out.reserve(data.size());
  bool ascii_only = true;
  for (const unsigned char ch : data) {
    if (ch >= 0x80) {
      ascii_only = false;
      break;
    }
  }
  if (ascii_only) {
    for (const unsigned char ch : data) {
      out.push_back(static_cast<char>((ch >= 'A' && ch <= 'Z') ? ch + 32 : ch));
    }
    return out;
  }

  for (const char32_t cp : decode(data)) {
    append(out, fold_case(cp));
  }
  return out;
}

bool is_alphanumeric(char32_t cp) {
  if (cp < 0x80) {
    return (cp >= '0' && cp <= '9') || (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z');
  }
  if (cp == 0xAA || cp == 0xB5 || cp == 0xBA) {
    return true;
  }
  if (in_range(cp, 0xC0, 0x2AF)) {
    return cp != 0xD7 && cp != 0xF7;
  }
  // Combining diacritics stay attached to the word they decorate.
  if (in_range(cp, 0x300, 0x36F)) {
    return true;
  }
  if (in_range(cp, 0x370, 0x3FF)) {
    return cp != 0x37E && cp != 0x387;
  }
  if (in_range(cp, 0x400, 0x52F)) {
    return !in_range(cp, 0x482, 0x489);
  }
  return in_range(cp, 0x531, 0x587) ||    // Armenian
         in_range(cp, 0x5D0, 0x5EA) ||    // Hebrew
         in_range(cp, 0x620, 0x64A) ||    // Arabic letters
         in_range(cp, 0x660, 0x669) ||    // Arabic-Indic digits
         in_range(cp, 0x671, 0x6D3) ||    //
         in_range(cp, 0x900, 0x963) ||    // Devanagari, vowel signs included
         in_range(cp, 0x966, 0x96F) ||    //
         in_range(cp, 0xE01, 0xE4E) ||    // Thai
         in_range(cp, 0xE50, 0xE59) ||    //
         in_range(cp, 0x1E00, 0x1EFF) ||  // Latin Extended Additional
         in_range(cp, 0x3041, 0x3096) ||  // Hiragana
         in_range(cp, 0x30A1, 0x30FA) ||  // Katakana
         cp == 0x30FC ||                  //
         in_range(cp, 0x3400, 0x4DBF) ||  // CJK
         in_range(cp, 0x4E00, 0x9FFF) ||  //
         in_range(cp, 0xAC00, 0xD7A3) ||  // Hangul
         in_range(cp, 0xFF10, 0xFF19) ||  // Fullwidth forms
         in_range(cp, 0xFF21, 0xFF3A) ||  //
         in_range(cp, 0xFF41, 0xFF5A);
}

bool is_space(char32_t cp) {
  switch (cp) {
    case U' ':
    case U'\t':
    case U'\n':
    case U'\r':
    case U'\v':
    case U'\f':
    case 0xA0:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return true;
    default:
      return in_range(cp, 0x2000, 0x200A);
  }
}

}  // namespace chat_digest::utf8
