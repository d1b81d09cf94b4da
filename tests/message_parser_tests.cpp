#include "chat_digest/message_parser.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "chat_digest/error.hpp"
#include "chat_digest/line_reassembler.hpp"

using chat_digest::CivilDate;
using chat_digest::ErrorKind;
using chat_digest::MessageKind;

namespace {

ErrorKind parse_error_kind(const std::string& raw) {
  try {
    chat_digest::parse_messages(raw);
  } catch (const chat_digest::AnalysisError& error) {
    return error.kind();
  }
  FAIL("expected parse_messages to throw");
  return ErrorKind::InternalInvariantViolation;
}

}  // namespace

TEST_CASE("bracketed headers with seconds and AM/PM are recognised", "[reassembler]") {
  const auto fields = chat_digest::match_header("[12/31/23, 10:15:30 PM] Alice: Hello");
  REQUIRE(fields.has_value());
  REQUIRE(fields->layout == chat_digest::HeaderLayout::Bracketed);
  REQUIRE(fields->first == 12);
  REQUIRE(fields->second == 31);
  REQUIRE(fields->year == 2023);
  REQUIRE(fields->meridiem == chat_digest::Meridiem::Pm);
  REQUIRE(fields->rest == "Alice: Hello");

  const auto when = chat_digest::resolve_timestamp(*fields, chat_digest::DateOrder::MonthFirst);
  REQUIRE(when.has_value());
  REQUIRE(when->date == CivilDate{2023, 12, 31});
  REQUIRE(when->hour == 22);
  REQUIRE(when->second == 30);
  REQUIRE_FALSE(chat_digest::resolve_timestamp(*fields, chat_digest::DateOrder::DayFirst).has_value());
}

TEST_CASE("dashed headers accept dots and narrow no-break spaces", "[reassembler]") {
  const auto dotted = chat_digest::match_header("31.12.2023, 22:45 - Bob: Hi");
  REQUIRE(dotted.has_value());
  REQUIRE(dotted->layout == chat_digest::HeaderLayout::Dashed);
  REQUIRE(dotted->separator == '.');
  REQUIRE(dotted->rest == "Bob: Hi");

  const auto narrow = chat_digest::match_header("1/2/24, 9:05\xE2\x80\xAFPM - Ann: late");
  REQUIRE(narrow.has_value());
  REQUIRE(narrow->meridiem == chat_digest::Meridiem::Pm);
  REQUIRE(chat_digest::resolve_timestamp(*narrow, chat_digest::DateOrder::MonthFirst)->hour == 21);

  const auto midnight = chat_digest::match_header("1/2/24, 12:05 AM - Ann: early");
  REQUIRE(midnight.has_value());
  REQUIRE(chat_digest::resolve_timestamp(*midnight, chat_digest::DateOrder::MonthFirst)->hour == 0);
}

TEST_CASE("lines that only look like timestamps are rejected", "[reassembler]") {
  REQUIRE_FALSE(chat_digest::match_header("hello there").has_value());
  REQUIRE_FALSE(chat_digest::match_header("12/31/2023 10:15 - Alice: no comma").has_value());
  REQUIRE_FALSE(chat_digest::match_header("12/31/2023, 25:15 - Alice: bad hour").has_value());
  REQUIRE_FALSE(chat_digest::match_header("12/31/2023, 13:15 PM - Alice: bad 12h").has_value());
  REQUIRE_FALSE(chat_digest::match_header("12/31.2023, 10:15 - Alice: mixed").has_value());
  REQUIRE_FALSE(chat_digest::match_header("[12/31/2023, 10:15 Alice: no bracket").has_value());
}

TEST_CASE("date order is voted across the whole export", "[reassembler]") {
  const std::string raw =
      "03/04/2024, 10:00 - Ann: ambiguous\n"
      "13/04/2024, 10:00 - Ann: only day-first works\n";
  const auto reassembled = chat_digest::reassemble_lines(raw);
  REQUIRE(reassembled.vote.day_first == 2);
  REQUIRE(reassembled.vote.month_first == 1);
  REQUIRE(reassembled.vote.chosen == chat_digest::DateOrder::DayFirst);
  REQUIRE(reassembled.messages.size() == 2);
  REQUIRE(reassembled.messages[0].timestamp.date == CivilDate{2024, 4, 3});
}

TEST_CASE("ambiguous exports fall back on the separator", "[reassembler]") {
  const auto slashed = chat_digest::parse_messages("01/02/2024, 10:00 - Ann: hi");
  REQUIRE(slashed[0].timestamp.date == CivilDate{2024, 1, 2});

  const auto dotted = chat_digest::parse_messages("01.02.2024, 10:00 - Ann: hi");
  REQUIRE(dotted[0].timestamp.date == CivilDate{2024, 2, 1});
}

TEST_CASE("headers impossible under the chosen order become continuation text",
          "[reassembler]") {
  const std::string raw =
      "13/01/2024, 10:00 - Ann: one\n"
      "14/01/2024, 10:00 - Ann: two\n"
      "01/31/2024, 10:00 - Ann: odd\n";
  const auto reassembled = chat_digest::reassemble_lines(raw);
  REQUIRE(reassembled.header_candidates == 3);
  REQUIRE(reassembled.malformed_headers == 1);
  REQUIRE(reassembled.messages.size() == 2);
  REQUIRE(reassembled.messages[1].tail == "\n01/31/2024, 10:00 - Ann: odd");
}

TEST_CASE("multi-line messages are reassembled into one message", "[parser]") {
  const std::string raw =
      "[1/2/24, 9:00:00 AM] Alice: first line\r\n"
      "second line\r\n"
      "   third line   \r\n"
      "[1/2/24, 9:01:00 AM] Bob: ok\r\n";
  const auto messages = chat_digest::parse_messages(raw);
  REQUIRE(messages.size() == 2);
  REQUIRE(messages[0].sender == "Alice");
  REQUIRE(messages[0].body == "first line\nsecond line\nthird line");
  REQUIRE(messages[1].body == "ok");
}

TEST_CASE("lines before the first header are dropped", "[parser]") {
  const auto reassembled = chat_digest::reassemble_lines(
      "exported from phone\n"
      "\n"
      "1/2/24, 9:00 - Alice: hi\n");
  REQUIRE(reassembled.dropped_lines == 2);
  REQUIRE(reassembled.messages.size() == 1);
}

TEST_CASE("system notices lose their sender", "[parser]") {
  const std::string raw =
      "12/01/2024, 10:00 - Messages and calls are end-to-end encrypted. No one outside of this "
      "chat, not even WhatsApp, can read or listen to them.\n"
      "12/01/2024, 10:01 - Alice created group \"Trip\"\n"
      "12/01/2024, 10:02 - Trip: \xE2\x80\x8E" "Alice added Bob\n"
      "12/01/2024, 10:03 - system: maintenance notice\n"
      "12/01/2024, 10:04 - Alice: Missed voice call\n"
      "12/01/2024, 10:05 - Alice: hello everyone\n";
  const auto messages = chat_digest::parse_messages(raw);
  REQUIRE(messages.size() == 6);
  for (std::size_t i = 0; i < 5; ++i) {
    REQUIRE(messages[i].kind == MessageKind::SystemEvent);
    REQUIRE(messages[i].sender.empty());
  }
  REQUIRE(messages[5].kind == MessageKind::Normal);
  REQUIRE(messages[5].sender == "Alice");
}

TEST_CASE("membership words without the export marker stay ordinary text", "[parser]") {
  REQUIRE(chat_digest::classify_body("Bob", "I added cheese to the list") == MessageKind::Normal);
}

TEST_CASE("deleted messages are tagged by who deleted them", "[parser]") {
  REQUIRE(chat_digest::classify_body("Alice", "You deleted this message") ==
          MessageKind::DeletedByAuthor);
  REQUIRE(chat_digest::classify_body("Alice", "\xE2\x80\x8EYou deleted this message.") ==
          MessageKind::DeletedByAuthor);
  REQUIRE(chat_digest::classify_body("Bob", "This message was deleted") ==
          MessageKind::DeletedByOther);
  REQUIRE(chat_digest::classify_body("Bob", "this message was deleted.") ==
          MessageKind::DeletedByOther);
  REQUIRE(chat_digest::classify_body("Bob", "Diese Nachricht wurde gel\xC3\xB6scht.") ==
          MessageKind::DeletedByOther);
  REQUIRE(chat_digest::classify_body("Bob", "why was this message deleted?") ==
          MessageKind::Normal);
}

TEST_CASE("sender names are stripped of marks and bidi controls", "[parser]") {
  REQUIRE(chat_digest::clean_sender("\xE2\x80\x8E" "Alice ") == "Alice");
  REQUIRE(chat_digest::clean_sender("\xE2\x80\xAA+1 555 0100\xE2\x80\xAC") == "+1 555 0100");
  REQUIRE(chat_digest::clean_sender("\xEF\xBB\xBF" "Bob") == "Bob");
}

TEST_CASE("a colon inside the text does not make a sender", "[parser]") {
  const auto messages = chat_digest::parse_messages("1/2/24, 9:00 - Meeting moved to 10:30\n");
  REQUIRE(messages.size() == 1);
  REQUIRE(messages[0].kind == MessageKind::SystemEvent);
}

TEST_CASE("a colon inside a quoted group subject stays part of the notice", "[parser]") {
  const std::string raw =
      "1/15/24, 9:00 AM - Alice: morning\n"
      "1/15/24, 9:01 AM - Alice changed the subject to \"Trip: Day 2\"\n"
      "1/15/24, 9:02 AM - Alice created group \"Work: 2024\"\n"
      "1/15/24, 9:03 AM - Bob: see you there\n";
  const auto messages = chat_digest::parse_messages(raw);
  REQUIRE(messages.size() == 4);
  REQUIRE(messages[1].kind == MessageKind::SystemEvent);
  REQUIRE(messages[1].sender.empty());
  REQUIRE(messages[1].body == "Alice changed the subject to \"Trip: Day 2\"");
  REQUIRE(messages[2].kind == MessageKind::SystemEvent);
  REQUIRE(messages[2].sender.empty());
  REQUIRE(messages[3].sender == "Bob");
}

TEST_CASE("messages are sorted by time with ties in input order", "[parser]") {
  const std::string raw =
      "1/3/24, 9:00 - Carol: later\n"
      "1/2/24, 9:00 - Alice: first\n"
      "1/2/24, 9:00 - Bob: second\n";
  const auto messages = chat_digest::parse_messages(raw);
  REQUIRE(messages.size() == 3);
  REQUIRE(messages[0].sender == "Alice");
  REQUIRE(messages[1].sender == "Bob");
  REQUIRE(messages[2].sender == "Carol");
  REQUIRE(messages[2].timestamp.date == CivilDate{2024, 1, 3});
}

TEST_CASE("blank and unrecognised exports fail with typed errors", "[parser]") {
  REQUIRE(parse_error_kind("") == ErrorKind::EmptyInput);
  REQUIRE(parse_error_kind("  \n\t\r\n") == ErrorKind::EmptyInput);
  REQUIRE(parse_error_kind("hello\nworld\n") == ErrorKind::UnrecognizedFormat);
  REQUIRE(chat_digest::error_kind_name(ErrorKind::UnrecognizedFormat) == "unrecognized_format");
}
