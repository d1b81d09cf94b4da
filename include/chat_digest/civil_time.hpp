#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chat_digest {

// Calendar date with no time zone attached. Month and day are 1-based.
struct CivilDate {
  int year = 1970;
  int month = 1;
  int day = 1;
};

bool operator==(const CivilDate& lhs, const CivilDate& rhs);
bool operator!=(const CivilDate& lhs, const CivilDate& rhs);

// Wall-clock time as written in the export. Never converted to a zoned instant.
struct LocalDateTime {
  CivilDate date;
  int hour = 0;
  int minute = 0;
  int second = 0;
};

bool is_leap_year(int year);
int days_in_month(int year, int month);
bool is_valid_date(int year, int month, int day);

// Days since 1970-01-01 in the proleptic Gregorian calendar.
std::int64_t days_from_civil(const CivilDate& date);
CivilDate civil_from_days(std::int64_t days);

// 0 = Sunday ... 6 = Saturday.
int weekday_index(const CivilDate& date);
std::string_view weekday_label(int index);
std::string_view month_name(int month);

// Seconds since 1970-01-01T00:00:00 treating the wall clock as UTC. Only meaningful for
// ordering and gaps between timestamps taken from the same export.
std::int64_t to_epoch_seconds(const LocalDateTime& when);

std::string format_iso_date(const CivilDate& date);
std::string format_year_month(const CivilDate& date);
std::string format_iso_datetime(const LocalDateTime& when);
// "January 05, 2024"
std::string format_long_date(const CivilDate& date);
// "January 05, 2024 at 09:15 PM"
std::string format_long_datetime(const LocalDateTime& when);

// Parses "YYYY-MM-DD"; rejects anything else, including impossible dates.
std::optional<CivilDate> parse_iso_date(std::string_view text);

}  // namespace chat_digest
