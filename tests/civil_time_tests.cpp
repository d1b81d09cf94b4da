#include "chat_digest/civil_time.hpp"

#include <catch2/catch_test_macros.hpp>

using chat_digest::CivilDate;
using chat_digest::LocalDateTime;

TEST_CASE("day numbers round-trip through the proleptic calendar", "[civil_time]") {
  REQUIRE(chat_digest::days_from_civil(CivilDate{1970, 1, 1}) == 0);
  REQUIRE(chat_digest::days_from_civil(CivilDate{2000, 3, 1}) == 11017);
  REQUIRE(chat_digest::days_from_civil(CivilDate{1969, 12, 31}) == -1);
  REQUIRE(chat_digest::civil_from_days(11017) == CivilDate{2000, 3, 1});
  REQUIRE(chat_digest::civil_from_days(-1) == CivilDate{1969, 12, 31});
}

TEST_CASE("leap years and month lengths", "[civil_time]") {
  REQUIRE(chat_digest::is_leap_year(2024));
  REQUIRE(chat_digest::is_leap_year(2000));
  REQUIRE_FALSE(chat_digest::is_leap_year(1900));
  REQUIRE(chat_digest::days_in_month(2024, 2) == 29);
  REQUIRE(chat_digest::days_in_month(2023, 2) == 28);
  REQUIRE_FALSE(chat_digest::is_valid_date(2023, 2, 29));
  REQUIRE_FALSE(chat_digest::is_valid_date(2023, 13, 1));
}

TEST_CASE("weekday index starts on Sunday", "[civil_time]") {
  REQUIRE(chat_digest::weekday_index(CivilDate{1970, 1, 1}) == 4);
  REQUIRE(chat_digest::weekday_index(CivilDate{2024, 1, 7}) == 0);
  REQUIRE(chat_digest::weekday_index(CivilDate{2024, 1, 8}) == 1);
  REQUIRE(chat_digest::weekday_index(CivilDate{1969, 12, 28}) == 0);
  REQUIRE(chat_digest::weekday_label(0) == "Sun");
  REQUIRE(chat_digest::weekday_label(6) == "Sat");
}

TEST_CASE("dates format for labels and journey text", "[civil_time]") {
  const LocalDateTime evening{CivilDate{2024, 1, 5}, 21, 15, 7};
  REQUIRE(chat_digest::format_iso_date(evening.date) == "2024-01-05");
  REQUIRE(chat_digest::format_year_month(evening.date) == "2024-01");
  REQUIRE(chat_digest::format_iso_datetime(evening) == "2024-01-05T21:15:07");
  REQUIRE(chat_digest::format_long_date(evening.date) == "January 05, 2024");
  REQUIRE(chat_digest::format_long_datetime(evening) == "January 05, 2024 at 09:15 PM");

  const LocalDateTime midnight{CivilDate{2024, 3, 10}, 0, 5, 0};
  REQUIRE(chat_digest::format_long_datetime(midnight) == "March 10, 2024 at 12:05 AM");
}

TEST_CASE("parse_iso_date accepts only real calendar dates", "[civil_time]") {
  REQUIRE(chat_digest::parse_iso_date("2024-02-29") == CivilDate{2024, 2, 29});
  REQUIRE_FALSE(chat_digest::parse_iso_date("2023-02-29").has_value());
  REQUIRE_FALSE(chat_digest::parse_iso_date("2024-2-29").has_value());
  REQUIRE_FALSE(chat_digest::parse_iso_date("not a date").has_value());
}

TEST_CASE("epoch seconds order wall-clock times", "[civil_time]") {
  const LocalDateTime before{CivilDate{2024, 3, 9}, 23, 59, 0};
  const LocalDateTime after{CivilDate{2024, 3, 10}, 0, 1, 0};
  REQUIRE(chat_digest::to_epoch_seconds(after) - chat_digest::to_epoch_seconds(before) == 120);
}
