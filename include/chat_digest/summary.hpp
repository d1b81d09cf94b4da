#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chat_digest {

struct Count {
  std::string label;
  std::uint64_t value = 0;
};

struct HourCount {
  std::uint32_t hour = 0;
  std::uint64_t value = 0;
};

// Weekday index 0 is Sunday, month index 0 is January.
struct PersonBuckets {
  std::string name;
  std::uint64_t messages = 0;
  std::array<std::uint64_t, 24> hourly{};
  std::array<std::uint64_t, 7> daily{};
  std::array<std::uint64_t, 12> monthly{};
};

struct FunFact {
  std::string name;
  std::uint64_t total_words = 0;
  std::uint64_t longest_message_words = 0;
  std::uint64_t unique_words = 0;  // words used exactly once
  std::uint64_t average_message_length = 0;
  std::vector<std::string> top_emojis;
};

struct PersonStat {
  std::string name;
  std::uint64_t total_words = 0;
  std::uint64_t unique_words = 0;  // distinct words
  std::uint64_t longest_message_words = 0;
  double average_words_per_message = 0.0;
  std::vector<Count> top_emojis;
  std::optional<std::string> dominant_color;
};

struct PersonDaily {
  std::string name;
  std::vector<Count> daily;
};

struct PersonPhrases {
  std::string name;
  std::vector<Count> phrases;
};

struct SentimentDay {
  std::string name;
  std::string day;
  double mean = 0.0;
  std::uint64_t pos = 0;
  std::uint64_t neu = 0;
  std::uint64_t neg = 0;
};

struct SentimentOverall {
  std::string name;
  double mean = 0.0;
  std::uint64_t pos = 0;
  std::uint64_t neu = 0;
  std::uint64_t neg = 0;
};

struct JourneyMessage {
  std::string sender;
  std::string text;
  std::string timestamp;
  bool is_you = false;
};

struct JourneyMoment {
  std::string title;
  std::string description;
  std::string date;
  std::vector<JourneyMessage> messages;
  double sentiment_score = 0.0;
};

struct Journey {
  std::string first_day;
  std::string last_day;
  std::uint64_t total_days = 0;
  std::uint64_t total_messages = 0;
  std::vector<JourneyMessage> first_messages;
  std::vector<JourneyMessage> last_messages;
  std::vector<JourneyMoment> interesting_moments;
};

struct StreakResult {
  std::uint64_t days = 0;
  std::string start;
  std::string end;
};

struct CalendarHighlights {
  std::optional<Count> busiest_day;
  std::optional<Count> quietest_day;
  StreakResult longest_streak;
};

struct Summary {
  std::uint64_t total_messages = 0;
  std::vector<Count> by_sender;
  std::vector<Count> daily;
  std::vector<HourCount> hourly;
  std::vector<Count> top_emojis;
  std::vector<Count> top_words;
  std::vector<Count> top_words_no_stop;
  std::uint64_t deleted_you = 0;
  std::uint64_t deleted_others = 0;
  std::vector<Count> timeline;
  std::vector<Count> weekly;
  std::vector<Count> monthly;
  std::vector<Count> share_of_speech;
  std::vector<PersonBuckets> buckets_by_person;
  std::vector<Count> word_cloud;
  std::vector<Count> word_cloud_no_stop;
  std::vector<Count> emoji_cloud;
  std::vector<Count> salient_phrases;
  std::vector<Count> top_phrases;
  std::vector<Count> top_phrases_no_stop;
  std::vector<PersonPhrases> per_person_phrases;
  std::vector<PersonPhrases> per_person_phrases_no_stop;
  std::vector<FunFact> fun_facts;
  std::vector<PersonStat> person_stats;
  std::vector<PersonDaily> per_person_daily;
  std::vector<SentimentDay> sentiment_by_day;
  std::vector<SentimentOverall> sentiment_overall;
  std::vector<Count> conversation_starters;
  std::uint64_t conversation_count = 0;
  std::optional<Journey> journey;
  CalendarHighlights calendar;
};

}  // namespace chat_digest
