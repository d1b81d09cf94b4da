#include "chat_digest/line_reassembler.hpp"

#include <cctype>

namespace chat_digest {
namespace {

bool starts_with(std::string_view input, std::size_t pos, std::string_view prefix) {
  return input.size() >= pos + prefix.size() && input.substr(pos, prefix.size()) == prefix;
}

std::size_t skip_leading_marks(std::string_view line) {
  static constexpr std::string_view kBom = "\xEF\xBB\xBF";
  static constexpr std::string_view kLrm = "\xE2\x80\x8E";
  static constexpr std::string_view kRlm = "\xE2\x80\x8F";

  std::size_t pos = 0;
  while (true) {
    if (starts_with(line, pos, kBom)) {
      pos += kBom.size();
    } else if (starts_with(line, pos, kLrm) || starts_with(line, pos, kRlm)) {
      pos += kLrm.size();
    } else {
      return pos;
    }
  }
}

// Consumes ASCII whitespace and the no-break / narrow no-break spaces found before AM/PM.
std::size_t skip_spaces(std::string_view line, std::size_t pos) {
  static constexpr std::string_view kNbsp = "\xC2\xA0";
  static constexpr std::string_view kNarrowNbsp = "\xE2\x80\xAF";

  while (pos < line.size()) {
    if (line[pos] == ' ' || line[pos] == '\t') {
      ++pos;
    } else if (starts_with(line, pos, kNbsp)) {
      pos += kNbsp.size();
    } else if (starts_with(line, pos, kNarrowNbsp)) {
      pos += kNarrowNbsp.size();
    } else {
      break;
    }
  }
  return pos;
}

// Reads between min_len and max_len digits.
bool read_number(std::string_view line, std::size_t& pos, std::size_t min_len, std::size_t max_len,
                 int& value, std::size_t* digits_read = nullptr) {
  std::size_t len = 0;
  int out = 0;
  while (pos + len < line.size() && len < max_len &&
         std::isdigit(static_cast<unsigned char>(line[pos + len])) != 0) {
    out = out * 10 + (line[pos + len] - '0');
    ++len;
  }
  if (len < min_len) {
    return false;
  }
  if (pos + len < line.size() && std::isdigit(static_cast<unsigned char>(line[pos + len])) != 0) {
    return false;
  }
  pos += len;
  value = out;
  if (digits_read != nullptr) {
    *digits_read = len;
  }
  return true;
}

Meridiem read_meridiem(std::string_view line, std::size_t& pos) {
  if (pos + 1 >= line.size()) {
    return Meridiem::None;
  }
  const char first = static_cast<char>(std::toupper(static_cast<unsigned char>(line[pos])));
  const char second = static_cast<char>(std::toupper(static_cast<unsigned char>(line[pos + 1])));
  if (second != 'M' || (first != 'A' && first != 'P')) {
    return Meridiem::None;
  }
  pos += 2;
  return first == 'A' ? Meridiem::Am : Meridiem::Pm;
}

}  // namespace

std::string_view date_order_name(DateOrder order) {
  switch (order) {
    case DateOrder::DayFirst:
      return "day-first";
    case DateOrder::MonthFirst:
      return "month-first";
  }
  return "unknown";
}

std::optional<HeaderFields> match_header(std::string_view line) {
  HeaderFields fields;
  std::size_t pos = skip_leading_marks(line);

  if (pos < line.size() && line[pos] == '[') {
    fields.layout = HeaderLayout::Bracketed;
    ++pos;
  }

  if (!read_number(line, pos, 1, 2, fields.first)) {
    return std::nullopt;
  }
  if (pos >= line.size() || (line[pos] != '/' && line[pos] != '.')) {
    return std::nullopt;
  }
  fields.separator = line[pos++];
  if (!read_number(line, pos, 1, 2, fields.second)) {
    return std::nullopt;
  }
  if (pos >= line.size() || line[pos] != fields.separator) {
    return std::nullopt;
  }
  ++pos;
  std::size_t year_digits = 0;
  if (!read_number(line, pos, 2, 4, fields.year, &year_digits) || year_digits == 3) {
    return std::nullopt;
  }
  if (year_digits == 2) {
    fields.year += 2000;
  }

  if (pos >= line.size() || line[pos] != ',') {
    return std::nullopt;
  }
  ++pos;
  const std::size_t after_comma = pos;
  pos = skip_spaces(line, pos);
  if (pos == after_comma) {
    return std::nullopt;
  }

  if (!read_number(line, pos, 1, 2, fields.hour)) {
    return std::nullopt;
  }
  if (pos >= line.size() || line[pos] != ':') {
    return std::nullopt;
  }
  ++pos;
  if (!read_number(line, pos, 2, 2, fields.minute)) {
    return std::nullopt;
  }
  if (pos < line.size() && line[pos] == ':') {
    ++pos;
    if (!read_number(line, pos, 2, 2, fields.seconds)) {
      return std::nullopt;
    }
  }

  const std::size_t after_clock = pos;
  pos = skip_spaces(line, pos);
  fields.meridiem = read_meridiem(line, pos);
  if (fields.meridiem == Meridiem::None) {
    pos = after_clock;
  }

  if (fields.minute > 59 || fields.seconds > 59) {
    return std::nullopt;
  }
  if (fields.meridiem == Meridiem::None ? fields.hour > 23
                                        : (fields.hour < 1 || fields.hour > 12)) {
    return std::nullopt;
  }

  if (fields.layout == HeaderLayout::Bracketed) {
    pos = skip_spaces(line, pos);
    if (pos >= line.size() || line[pos] != ']') {
      return std::nullopt;
    }
    ++pos;
    const std::size_t after_bracket = pos;
    pos = skip_spaces(line, pos);
    if (pos == after_bracket) {
      return std::nullopt;
    }
  } else {
    const std::size_t before_dash = pos;
    pos = skip_spaces(line, pos);
    if (pos == before_dash || pos >= line.size() || line[pos] != '-') {
      return std::nullopt;
    }
    ++pos;
    const std::size_t after_dash = pos;
    pos = skip_spaces(line, pos);
    if (pos == after_dash) {
      return std::nullopt;
    }
  }

  fields.rest = line.substr(pos);
  while (!fields.rest.empty() &&
         std::isspace(static_cast<unsigned char>(fields.rest.back())) != 0) {
    fields.rest.remove_suffix(1);
  }
  if (fields.rest.empty()) {
    return std::nullopt;
  }
  return fields;
}

std::optional<CivilDate> resolve_date(const HeaderFields& fields, DateOrder order) {
  CivilDate date;
  date.year = fields.year;
  if (order == DateOrder::DayFirst) {
    date.day = fields.first;
    date.month = fields.second;
  } else {
    date.month = fields.first;
    date.day = fields.second;
  }
  if (!is_valid_date(date.year, date.month, date.day)) {
    return std::nullopt;
  }
  return date;
}

std::optional<LocalDateTime> resolve_timestamp(const HeaderFields& fields, DateOrder order) {
  const auto date = resolve_date(fields, order);
  if (!date.has_value()) {
    return std::nullopt;
  }

  LocalDateTime when;
  when.date = *date;
  when.hour = fields.hour;
  when.minute = fields.minute;
  when.second = fields.seconds;
  if (fields.meridiem == Meridiem::Am && when.hour == 12) {
    when.hour = 0;
  } else if (fields.meridiem == Meridiem::Pm && when.hour != 12) {
    when.hour += 12;
  }
  return when;
}

DateOrderVote vote_date_order(const std::vector<HeaderFields>& candidates) {
  DateOrderVote vote;
  for (const HeaderFields& fields : candidates) {
    if (resolve_date(fields, DateOrder::DayFirst).has_value()) {
      ++vote.day_first;
    }
    if (resolve_date(fields, DateOrder::MonthFirst).has_value()) {
      ++vote.month_first;
    }
    if (fields.separator == '.') {
      ++vote.dotted;
    } else {
      ++vote.slashed;
    }
  }

  if (vote.day_first != vote.month_first) {
    vote.chosen = vote.day_first > vote.month_first ? DateOrder::DayFirst : DateOrder::MonthFirst;
  } else {
    vote.chosen = vote.dotted > vote.slashed ? DateOrder::DayFirst : DateOrder::MonthFirst;
  }
  return vote;
}

std::vector<std::string_view> split_lines(std::string_view raw) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (start <= raw.size()) {
    std::size_t end = raw.find('\n', start);
    if (end == std::string_view::npos) {
      end = raw.size();
    }
    std::string_view line = raw.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (end == raw.size()) {
      if (!line.empty()) {
        lines.push_back(line);
      }
      break;
    }
    lines.push_back(line);
    start = end + 1;
  }
  return lines;
}

ReassembledText reassemble_lines(std::string_view raw) {
  const std::vector<std::string_view> lines = split_lines(raw);

  std::vector<std::optional<HeaderFields>> headers;
  headers.reserve(lines.size());
  std::vector<HeaderFields> candidates;
  for (const std::string_view line : lines) {
    headers.push_back(match_header(line));
    if (headers.back().has_value()) {
      candidates.push_back(*headers.back());
    }
  }

  ReassembledText result;
  result.header_candidates = candidates.size();
  result.vote = vote_date_order(candidates);

  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (headers[i].has_value()) {
      const auto timestamp = resolve_timestamp(*headers[i], result.vote.chosen);
      if (timestamp.has_value()) {
        LogicalMessage message;
        message.timestamp = *timestamp;
        message.head = headers[i]->rest;
        result.messages.push_back(std::move(message));
        continue;
      }
      ++result.malformed_headers;
    }

    if (result.messages.empty()) {
      ++result.dropped_lines;
      continue;
    }

    std::string_view text = lines[i];
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
      text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
      text.remove_suffix(1);
    }
    std::string& tail = result.messages.back().tail;
    tail.push_back('\n');
    tail.append(text.data(), text.size());
  }

  return result;
}

}  // namespace chat_digest
