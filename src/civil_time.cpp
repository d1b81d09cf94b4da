#include "chat_digest/civil_time.hpp"

#include <array>
#include <cctype>
#include <cstdio>

namespace chat_digest {
namespace {

constexpr std::array<std::string_view, 7> kWeekdayLabels{"Sun", "Mon", "Tue", "Wed",
                                                         "Thu", "Fri", "Sat"};

constexpr std::array<std::string_view, 12> kMonthNames{
    "January", "February", "March",     "April",   "May",      "June",
    "July",    "August",   "September", "October", "November", "December"};

bool parse_fixed_int(std::string_view input, std::size_t pos, std::size_t len, int& value) {
  if (pos + len > input.size()) {
    return false;
  }

  int out = 0;
  for (std::size_t i = 0; i < len; ++i) {
    const unsigned char ch = static_cast<unsigned char>(input[pos + i]);
    if (std::isdigit(ch) == 0) {
      return false;
    }
    out = out * 10 + (ch - static_cast<unsigned char>('0'));
  }

  value = out;
  return true;
}

}  // namespace

bool operator==(const CivilDate& lhs, const CivilDate& rhs) {
  return lhs.year == rhs.year && lhs.month == rhs.month && lhs.day == rhs.day;
}

bool operator!=(const CivilDate& lhs, const CivilDate& rhs) {
  return !(lhs == rhs);
}

bool is_leap_year(int year) {
  if (year % 400 == 0) {
    return true;
  }
  if (year % 100 == 0) {
    return false;
  }
  return year % 4 == 0;
}

int days_in_month(int year, int month) {
  static constexpr int kDaysByMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) {
    return 0;
  }
  if (month == 2 && is_leap_year(year)) {
    return 29;
  }
  return kDaysByMonth[month - 1];
}

bool is_valid_date(int year, int month, int day) {
  return month >= 1 && month <= 12 && day >= 1 && day <= days_in_month(year, month);
}

// Howard Hinnant's days_from_civil.
std::int64_t days_from_civil(const CivilDate& date) {
  const std::int64_t y = static_cast<std::int64_t>(date.year) - (date.month <= 2 ? 1 : 0);
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const std::int64_t yoe = y - era * 400;
  const std::int64_t m = date.month;
  const std::int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + date.day - 1;
  const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

CivilDate civil_from_days(std::int64_t days) {
  const std::int64_t z = days + 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const std::int64_t doe = z - era * 146097;
  const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const std::int64_t mp = (5 * doy + 2) / 153;
  const std::int64_t d = doy - (153 * mp + 2) / 5 + 1;
  const std::int64_t m = mp < 10 ? mp + 3 : mp - 9;
  const std::int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);

  CivilDate out;
  out.year = static_cast<int>(y);
  out.month = static_cast<int>(m);
  out.day = static_cast<int>(d);
  return out;
}

int weekday_index(const CivilDate& date) {
  // 1970-01-01 was a Thursday.
  const std::int64_t index = (days_from_civil(date) + 4) % 7;
  return static_cast<int>(index < 0 ? index + 7 : index);
}

std::string_view weekday_label(int index) {
  if (index < 0 || index >= static_cast<int>(kWeekdayLabels.size())) {
    return "?";
  }
  return kWeekdayLabels[static_cast<std::size_t>(index)];
}

std::string_view month_name(int month) {
  if (month < 1 || month > 12) {
    return "?";
  }
  return kMonthNames[static_cast<std::size_t>(month - 1)];
}

std::int64_t to_epoch_seconds(const LocalDateTime& when) {
  return days_from_civil(when.date) * 86400 + when.hour * 3600 + when.minute * 60 + when.second;
}

std::string format_iso_date(const CivilDate& date) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", date.year, date.month, date.day);
  return buffer;
}

std::string format_year_month(const CivilDate& date) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d", date.year, date.month);
  return buffer;
}

std::string format_iso_datetime(const LocalDateTime& when) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d", when.date.year,
                when.date.month, when.date.day, when.hour, when.minute, when.second);
  return buffer;
}

std::string format_long_date(const CivilDate& date) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), " %02d, %04d", date.day, date.year);
  return std::string{month_name(date.month)} + buffer;
}

std::string format_long_datetime(const LocalDateTime& when) {
  int hour12 = when.hour % 12;
  if (hour12 == 0) {
    hour12 = 12;
  }
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), " at %02d:%02d %s", hour12, when.minute,
                when.hour < 12 ? "AM" : "PM");
  return format_long_date(when.date) + buffer;
}

std::optional<CivilDate> parse_iso_date(std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }

  CivilDate date;
  if (!parse_fixed_int(text, 0, 4, date.year) || !parse_fixed_int(text, 5, 2, date.month) ||
      !parse_fixed_int(text, 8, 2, date.day)) {
    return std::nullopt;
  }
  if (!is_valid_date(date.year, date.month, date.day)) {
    return std::nullopt;
  }
  return date;
}

}  // namespace chat_digest
