#include "chat_digest/summary_json.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST_CASE("escape_json_string escapes quotes and control characters", "[json]") {
  REQUIRE(chat_digest::escape_json_string("say \"hi\"\\now") == "say \\\"hi\\\"\\\\now");
  REQUIRE(chat_digest::escape_json_string("a\nb\tc\r") == "a\\nb\\tc\\r");
  REQUIRE(chat_digest::escape_json_string(std::string("x\x01y")) == "x\\u0001y");
  REQUIRE(chat_digest::escape_json_string("caf\xC3\xA9") == "caf\xC3\xA9");
}

TEST_CASE("an empty summary writes nulls for absent values", "[json]") {
  const std::string json = chat_digest::to_json(chat_digest::Summary{});
  REQUIRE(json.front() == '{');
  REQUIRE(contains(json, "\"total_messages\": 0,\n"));
  REQUIRE(contains(json, "\"journey\": null"));
  REQUIRE(contains(json, "\"busiest_day\": null"));
  REQUIRE(contains(json, "\"longest_streak\": {\"days\": 0, \"start\": \"\", \"end\": \"\"}"));
}

TEST_CASE("nested values are written compactly", "[json]") {
  chat_digest::Summary summary;
  summary.total_messages = 3;
  summary.by_sender = {{"Al \"the\" pal", 2}, {"Bo", 1}};
  chat_digest::PersonStat stat;
  stat.name = "Bo";
  stat.average_words_per_message = 2.0 / 3.0;
  summary.person_stats.push_back(stat);
  chat_digest::SentimentOverall overall;
  overall.name = "Bo";
  overall.mean = -0.25;
  overall.neg = 1;
  summary.sentiment_overall.push_back(overall);

  std::ostringstream out;
  chat_digest::write_json(out, summary);
  const std::string json = out.str();

  REQUIRE(contains(json, "\"by_sender\": [{\"label\": \"Al \\\"the\\\" pal\", \"value\": 2}, "
                         "{\"label\": \"Bo\", \"value\": 1}]"));
  REQUIRE(contains(json, "\"average_words_per_message\": 0.6667"));
  REQUIRE(contains(json, "\"dominant_color\": null"));
  REQUIRE(contains(json, "{\"name\": \"Bo\", \"mean\": -0.2500, \"pos\": 0, \"neu\": 0, "
                         "\"neg\": 1}"));
}

TEST_CASE("malformed UTF-8 is written as replacement characters", "[json]") {
  REQUIRE(chat_digest::escape_json_string("caf\xE9 latte") == "caf\xEF\xBF\xBD latte");
  REQUIRE(chat_digest::escape_json_string("end\xF0\x9F") == "end\xEF\xBF\xBD\xEF\xBF\xBD");

  chat_digest::Summary summary;
  summary.by_sender = {{"caf\xE9", 1}};
  const std::string json = chat_digest::to_json(summary);
  REQUIRE(contains(json, "{\"label\": \"caf\xEF\xBF\xBD\", \"value\": 1}"));
  REQUIRE_FALSE(contains(json, "\xE9"));
}

TEST_CASE("writing a summary leaves the stream format alone", "[json]") {
  chat_digest::Summary summary;
  summary.sentiment_overall.push_back(chat_digest::SentimentOverall{});

  std::ostringstream out;
  chat_digest::write_json(out, summary);
  out.str("");
  out << 1.5;
  REQUIRE(out.str() == "1.5");
}
