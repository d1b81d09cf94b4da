#include "chat_digest/analyzer.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "chat_digest/conversations.hpp"
#include "chat_digest/error.hpp"
#include "chat_digest/export_reader.hpp"
#include "chat_digest/summary_json.hpp"

using chat_digest::ErrorKind;

namespace {

std::string write_temp_export(std::string_view name_prefix, std::string_view content) {
  static std::uint64_t counter = 0;
  const std::filesystem::path path =
      std::filesystem::temp_directory_path() /
      (std::string{name_prefix} + "_" + std::to_string(counter++) + ".txt");
  std::ofstream out(path);
  out << content;
  out.close();
  return path.string();
}

ErrorKind analysis_error_kind(std::string_view raw) {
  try {
    chat_digest::ChatAnalyzer{}.analyze(raw);
  } catch (const chat_digest::AnalysisError& error) {
    return error.kind();
  }
  FAIL("expected analyze to throw");
  return ErrorKind::InternalInvariantViolation;
}

constexpr std::string_view kSampleChat =
    "1/15/24, 9:00 AM - Messages and calls are end-to-end encrypted. No one outside of this "
    "chat, not even WhatsApp, can read or listen to them.\n"
    "1/14/24, 8:00 PM - Alice: Pizza tonight?\n"
    "1/14/24, 8:05 PM - Bob: I love pizza\n"
    "1/15/24, 9:00 AM - Alice: Pizza again, I love this\n"
    "it is so good\n"
    "1/15/24, 9:02 AM - Bob: This message was deleted\n"
    "1/15/24, 11:00 AM - Bob: see you at noon\n"
    "1/15/24, 11:05 AM - Alice: You deleted this message\n";

}  // namespace

TEST_CASE("a small chat is summarised end to end", "[analyze]") {
  const chat_digest::Summary summary = chat_digest::ChatAnalyzer{}.analyze(kSampleChat);

  REQUIRE(summary.total_messages == 6);
  REQUIRE(summary.deleted_you == 1);
  REQUIRE(summary.deleted_others == 1);

  REQUIRE(summary.by_sender.size() == 2);
  REQUIRE(summary.by_sender[0].label == "Alice");
  REQUIRE(summary.by_sender[0].value == 3);
  REQUIRE(summary.share_of_speech.size() == summary.by_sender.size());

  REQUIRE(summary.conversation_count == 3);
  REQUIRE(summary.conversation_starters[0].label == "Alice");
  REQUIRE(summary.conversation_starters[0].value == 2);

  REQUIRE(summary.top_words.size() >= 2);
  REQUIRE(summary.top_words[0].label == "pizza");
  REQUIRE(summary.top_words[0].value == 3);
  REQUIRE(summary.top_words[1].label == "love");
  REQUIRE(summary.top_words[1].value == 2);

  REQUIRE(summary.daily.size() == 2);
  REQUIRE(summary.timeline.size() == 2);
  REQUIRE(summary.calendar.longest_streak.days == 2);
  REQUIRE(summary.calendar.longest_streak.start == "2024-01-14");
  REQUIRE(summary.calendar.busiest_day->label == "2024-01-15");
  REQUIRE(summary.calendar.busiest_day->value == 4);
  REQUIRE(summary.calendar.quietest_day->label == "2024-01-14");
}

TEST_CASE("sentiment and the journey follow the parsed messages", "[analyze]") {
  const chat_digest::Summary summary = chat_digest::ChatAnalyzer{}.analyze(kSampleChat);

  REQUIRE(summary.sentiment_overall.size() == 2);
  REQUIRE(summary.sentiment_overall[0].name == "Alice");
  REQUIRE(summary.sentiment_overall[0].mean == Catch::Approx(0.5));
  REQUIRE(summary.sentiment_overall[1].name == "Bob");
  REQUIRE(summary.sentiment_overall[1].mean == Catch::Approx(0.5));

  REQUIRE(summary.journey.has_value());
  const chat_digest::Journey& journey = *summary.journey;
  REQUIRE(journey.first_day == "January 14, 2024");
  REQUIRE(journey.last_day == "January 15, 2024");
  REQUIRE(journey.total_days == 1);
  REQUIRE(journey.total_messages == 6);
  REQUIRE(journey.first_messages.size() == 2);
  REQUIRE(journey.first_messages[0].sender == "Alice");
  REQUIRE(journey.first_messages[0].is_you);
  REQUIRE(journey.last_messages.size() == 2);
  REQUIRE(journey.last_messages[1].text == "You deleted this message");
  REQUIRE(journey.interesting_moments.empty());
}

TEST_CASE("multi-line bodies reach the per-person statistics", "[analyze]") {
  const chat_digest::Summary summary = chat_digest::ChatAnalyzer{}.analyze(kSampleChat);

  REQUIRE(summary.person_stats.size() == 2);
  for (const auto& person : summary.person_stats) {
    if (person.name == "Alice") {
      REQUIRE(person.longest_message_words == 9);
    }
  }
}

TEST_CASE("list sizes follow the requested counts", "[analyze]") {
  const chat_digest::Summary summary = chat_digest::analyze(kSampleChat, 1, 0);
  REQUIRE(summary.top_words.size() == 1);
  REQUIRE(summary.top_words_no_stop.size() == 1);
  REQUIRE(summary.top_emojis.empty());
}

TEST_CASE("analysis is deterministic", "[analyze]") {
  const chat_digest::ChatAnalyzer analyzer;
  REQUIRE(chat_digest::to_json(analyzer.analyze(kSampleChat)) ==
          chat_digest::to_json(analyzer.analyze(kSampleChat)));
}

TEST_CASE("unusable exports fail with a typed error", "[analyze]") {
  REQUIRE(analysis_error_kind("") == ErrorKind::EmptyInput);
  REQUIRE(analysis_error_kind("just some notes\nno timestamps here\n") ==
          ErrorKind::UnrecognizedFormat);
  REQUIRE(analysis_error_kind("1/15/24, 9:00 AM - Alice created group \"Trip\"\n") ==
          ErrorKind::UnrecognizedFormat);
}

TEST_CASE("an out-of-range conversation gap is rejected up front", "[analyze]") {
  chat_digest::AnalyzeOptions options;
  options.conversation_gap_minutes = -5;
  REQUIRE_THROWS_AS(chat_digest::ChatAnalyzer(options), std::invalid_argument);

  options.conversation_gap_minutes = chat_digest::kMaxConversationGapMinutes + 1;
  REQUIRE_THROWS_AS(chat_digest::ChatAnalyzer(options), std::invalid_argument);

  options.conversation_gap_minutes = chat_digest::kMaxConversationGapMinutes;
  REQUIRE_NOTHROW(chat_digest::ChatAnalyzer(options));
}

TEST_CASE("validate_summary reports broken totals", "[analyze]") {
  chat_digest::Summary summary = chat_digest::ChatAnalyzer{}.analyze(kSampleChat);
  REQUIRE_NOTHROW(chat_digest::validate_summary(summary));

  summary.total_messages += 1;
  try {
    chat_digest::validate_summary(summary);
    FAIL("expected validate_summary to throw");
  } catch (const chat_digest::AnalysisError& error) {
    REQUIRE(error.kind() == ErrorKind::InternalInvariantViolation);
  }
}

TEST_CASE("export files are joined in argument order", "[analyze]") {
  const std::string first = write_temp_export("chat_digest_part_a",
                                              "1/14/24, 8:00 PM - Alice: Pizza tonight?");
  const std::string second = write_temp_export("chat_digest_part_b",
                                               "1/14/24, 8:05 PM - Bob: I love pizza\n");

  const std::string joined = chat_digest::read_exports({first, second});
  REQUIRE(joined ==
          "1/14/24, 8:00 PM - Alice: Pizza tonight?\n1/14/24, 8:05 PM - Bob: I love pizza\n");
  REQUIRE(chat_digest::ChatAnalyzer{}.analyze(joined).total_messages == 2);

  REQUIRE_THROWS_AS(chat_digest::read_exports({}), std::invalid_argument);
  REQUIRE_THROWS_AS(chat_digest::read_exports({"/nonexistent/chat_digest/missing.txt"}),
                    std::runtime_error);
}
