#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chat_digest/civil_time.hpp"

namespace chat_digest {

enum class HeaderLayout {
  Bracketed,  // "[31/12/2023, 22:45:10] Alice: hi"
  Dashed,     // "31/12/2023, 22:45 - Alice: hi"
};

enum class DateOrder {
  DayFirst,
  MonthFirst,
};

std::string_view date_order_name(DateOrder order);

enum class Meridiem {
  None,
  Am,
  Pm,
};

// Structural match of a timestamped header line. The two leading date components are kept
// uninterpreted until the export-wide date order has been decided.
struct HeaderFields {
  HeaderLayout layout = HeaderLayout::Dashed;
  int first = 0;
  int second = 0;
  int year = 0;
  char separator = '/';
  int hour = 0;
  int minute = 0;
  int seconds = 0;
  Meridiem meridiem = Meridiem::None;
  std::string_view rest;  // text after the timestamp delimiter
};

std::optional<HeaderFields> match_header(std::string_view line);

std::optional<CivilDate> resolve_date(const HeaderFields& fields, DateOrder order);
std::optional<LocalDateTime> resolve_timestamp(const HeaderFields& fields, DateOrder order);

struct DateOrderVote {
  std::size_t day_first = 0;
  std::size_t month_first = 0;
  std::size_t dotted = 0;
  std::size_t slashed = 0;
  DateOrder chosen = DateOrder::MonthFirst;
};

// Scores both date orders over every candidate header and commits to the better one.
// Ties go to day-first for dot-separated exports and month-first otherwise.
DateOrderVote vote_date_order(const std::vector<HeaderFields>& candidates);

// One timestamped header plus the continuation lines that follow it.
struct LogicalMessage {
  LocalDateTime timestamp;
  std::string_view head;  // header text after the delimiter; views into the raw input
  std::string tail;       // continuation lines, each prefixed with '\n'
};

struct ReassembledText {
  std::vector<LogicalMessage> messages;
  DateOrderVote vote;
  std::size_t header_candidates = 0;
  std::size_t malformed_headers = 0;
  std::size_t dropped_lines = 0;
};

std::vector<std::string_view> split_lines(std::string_view raw);

// The returned messages view into `raw`, which must outlive them.
ReassembledText reassemble_lines(std::string_view raw);

}  // namespace chat_digest
