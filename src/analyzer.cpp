#include "chat_digest/analyzer.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <spdlog/stopwatch.h>

#include "chat_digest/conversations.hpp"
#include "chat_digest/error.hpp"
#include "chat_digest/frequency.hpp"
#include "chat_digest/journey.hpp"
#include "chat_digest/logging.hpp"
#include "chat_digest/message_parser.hpp"
#include "chat_digest/person_stats.hpp"
#include "chat_digest/phrases.hpp"
#include "chat_digest/sentiment.hpp"
#include "chat_digest/streaks.hpp"
#include "chat_digest/text.hpp"
#include "chat_digest/time_buckets.hpp"

namespace chat_digest {
namespace {

[[noreturn]] void violation(const std::string& what) {
  throw AnalysisError(ErrorKind::InternalInvariantViolation, what);
}

template <typename Range, typename Value>
std::uint64_t sum_of(const Range& range, Value value) {
  std::uint64_t total = 0;
  for (const auto& item : range) {
    total += value(item);
  }
  return total;
}

std::uint64_t sum_counts(const std::vector<Count>& counts) {
  return sum_of(counts, [](const Count& count) { return count.value; });
}

template <std::size_t N>
std::uint64_t sum_array(const std::array<std::uint64_t, N>& values) {
  return std::accumulate(values.begin(), values.end(), std::uint64_t{0});
}

void require_ranked(const std::vector<Count>& counts, const char* field) {
  const auto out_of_order =
      std::adjacent_find(counts.begin(), counts.end(), [](const Count& lhs, const Count& rhs) {
        return lhs.value < rhs.value;
      });
  if (out_of_order != counts.end()) {
    violation(std::string(field) + " is not sorted by count");
  }
}

template <typename Bucket>
void require_sentiment_counts(const Bucket& bucket, const char* field) {
  if (bucket.mean < -1.0 || bucket.mean > 1.0) {
    violation(std::string(field) + " mean is outside [-1, 1] for " + bucket.name);
  }
  if (bucket.pos + bucket.neu + bucket.neg == 0 && bucket.mean != 0.0) {
    violation(std::string(field) + " has a mean without scored messages for " + bucket.name);
  }
}

std::pair<std::uint64_t, std::uint64_t> deleted_counts(const std::vector<Message>& messages) {
  std::uint64_t you = 0;
  std::uint64_t others = 0;
  for (const Message& message : messages) {
    if (message.kind == MessageKind::DeletedByAuthor) {
      ++you;
    } else if (message.kind == MessageKind::DeletedByOther) {
      ++others;
    }
  }
  return {you, others};
}

}  // namespace

ChatAnalyzer::ChatAnalyzer(AnalyzeOptions options) : options_(options) {
  if (options_.conversation_gap_minutes < 0 ||
      options_.conversation_gap_minutes > kMaxConversationGapMinutes) {
    throw std::invalid_argument("conversation gap is out of range");
  }
}

Summary ChatAnalyzer::analyze(std::string_view raw_text) const {
  spdlog::stopwatch total_watch;
  spdlog::stopwatch stage_watch;

  const std::vector<Message> messages = parse_messages(raw_text);
  const auto activity = static_cast<std::uint64_t>(std::count_if(
      messages.begin(), messages.end(), [](const Message& message) { return message.is_activity(); }));
  if (activity == 0) {
    throw AnalysisError(ErrorKind::UnrecognizedFormat,
                        "chat export contains only system events");
  }
  logger()->debug("parsed {} messages ({} activity) in {:.3f}s", messages.size(), activity,
                  stage_watch.elapsed().count());

  stage_watch.reset();
  const std::vector<TokenizedMessage> tokenized = tokenize_messages(messages);
  logger()->debug("tokenized {} messages in {:.3f}s", tokenized.size(),
                  stage_watch.elapsed().count());

  Summary summary;
  summary.total_messages = activity;
  summary.by_sender = count_by_sender(messages);
  summary.share_of_speech = summary.by_sender;

  stage_watch.reset();
  TimeBuckets buckets = bucket_messages(messages);
  summary.daily = std::move(buckets.daily);
  summary.hourly = std::move(buckets.hourly);
  summary.timeline = std::move(buckets.timeline);
  summary.weekly = std::move(buckets.weekly);
  summary.monthly = std::move(buckets.monthly);
  summary.buckets_by_person = std::move(buckets.by_person);
  summary.per_person_daily = std::move(buckets.per_person_daily);
  summary.calendar = calendar_highlights(summary.daily);
  std::tie(summary.deleted_you, summary.deleted_others) = deleted_counts(messages);
  logger()->debug("time buckets in {:.3f}s", stage_watch.elapsed().count());

  stage_watch.reset();
  summary.top_words = top_words(tokenized, options_.top_words_n, true);
  summary.top_words_no_stop = top_words(tokenized, options_.top_words_n, false);
  summary.top_emojis = top_emojis(tokenized, options_.top_emojis_n);
  summary.word_cloud = word_cloud(tokenized, options_.word_cloud_size, true);
  summary.word_cloud_no_stop = word_cloud(tokenized, options_.word_cloud_size, false);
  summary.emoji_cloud = emoji_cloud(tokenized, options_.emoji_cloud_size);
  summary.fun_facts = fun_facts(tokenized, summary.by_sender);
  summary.person_stats = person_stats(tokenized, summary.by_sender);
  logger()->debug("word and emoji frequencies in {:.3f}s", stage_watch.elapsed().count());

  stage_watch.reset();
  summary.salient_phrases = salient_phrases(tokenized, options_.phrase_count);
  summary.top_phrases = top_phrases(tokenized, options_.phrase_count, true);
  summary.top_phrases_no_stop = top_phrases(tokenized, options_.phrase_count, false);
  summary.per_person_phrases =
      per_person_phrases(tokenized, options_.per_person_phrase_count, true);
  summary.per_person_phrases_no_stop =
      per_person_phrases(tokenized, options_.per_person_phrase_count, false);
  logger()->debug("phrases in {:.3f}s", stage_watch.elapsed().count());

  stage_watch.reset();
  const std::vector<std::optional<SentimentScore>> scores = score_messages(messages);
  SentimentBreakdown sentiment = sentiment_breakdown(messages, scores, summary.by_sender);
  summary.sentiment_by_day = std::move(sentiment.by_day);
  summary.sentiment_overall = std::move(sentiment.overall);
  logger()->debug("sentiment in {:.3f}s", stage_watch.elapsed().count());

  ConversationStats conversations =
      conversation_starters(messages, options_.conversation_gap_minutes);
  summary.conversation_starters = std::move(conversations.starters);
  summary.conversation_count = conversations.conversation_count;

  stage_watch.reset();
  JourneyOptions journey_options;
  journey_options.gap_minutes = options_.conversation_gap_minutes;
  journey_options.max_moments = options_.max_moments;
  summary.journey = build_journey(messages, scores, journey_options);
  logger()->debug("journey with {} moment(s) in {:.3f}s",
                  summary.journey ? summary.journey->interesting_moments.size() : 0,
                  stage_watch.elapsed().count());

  validate_summary(summary);
  logger()->debug("analysis finished in {:.3f}s", total_watch.elapsed().count());
  return summary;
}

Summary analyze(std::string_view raw_text, std::size_t top_words_n, std::size_t top_emojis_n) {
  AnalyzeOptions options;
  options.top_words_n = top_words_n;
  options.top_emojis_n = top_emojis_n;
  return ChatAnalyzer(options).analyze(raw_text);
}

void validate_summary(const Summary& summary) {
  const std::uint64_t bucketed = sum_of(
      summary.buckets_by_person, [](const PersonBuckets& person) { return person.messages; });
  if (bucketed != summary.total_messages) {
    violation("person buckets hold " + std::to_string(bucketed) + " messages, expected " +
              std::to_string(summary.total_messages));
  }
  if (sum_counts(summary.by_sender) != summary.total_messages) {
    violation("by_sender does not add up to total_messages");
  }
  for (const PersonBuckets& person : summary.buckets_by_person) {
    if (sum_array(person.hourly) != person.messages || sum_array(person.daily) != person.messages ||
        sum_array(person.monthly) != person.messages) {
      violation("hourly, weekday and monthly buckets disagree for " + person.name);
    }
  }
  const std::uint64_t hourly =
      sum_of(summary.hourly, [](const HourCount& hour) { return hour.value; });
  if (hourly != summary.total_messages || sum_counts(summary.daily) != summary.total_messages ||
      sum_counts(summary.timeline) != summary.total_messages ||
      sum_counts(summary.weekly) != summary.total_messages ||
      sum_counts(summary.monthly) != summary.total_messages) {
    violation("global time buckets do not add up to total_messages");
  }

  if (sum_counts(summary.conversation_starters) != summary.conversation_count) {
    violation("conversation starters do not add up to conversation_count");
  }

  std::uint64_t scored_by_day = 0;
  for (const SentimentDay& day : summary.sentiment_by_day) {
    require_sentiment_counts(day, "sentiment_by_day");
    scored_by_day += day.pos + day.neu + day.neg;
  }
  std::uint64_t scored_overall = 0;
  for (const SentimentOverall& person : summary.sentiment_overall) {
    require_sentiment_counts(person, "sentiment_overall");
    scored_overall += person.pos + person.neu + person.neg;
  }
  if (scored_by_day != scored_overall) {
    violation("daily and overall sentiment cover different messages");
  }

  require_ranked(summary.by_sender, "by_sender");
  require_ranked(summary.top_words, "top_words");
  require_ranked(summary.top_words_no_stop, "top_words_no_stop");
  require_ranked(summary.top_emojis, "top_emojis");
  require_ranked(summary.word_cloud, "word_cloud");
  require_ranked(summary.word_cloud_no_stop, "word_cloud_no_stop");
  require_ranked(summary.emoji_cloud, "emoji_cloud");
  require_ranked(summary.salient_phrases, "salient_phrases");
  require_ranked(summary.top_phrases, "top_phrases");
  require_ranked(summary.top_phrases_no_stop, "top_phrases_no_stop");
  require_ranked(summary.conversation_starters, "conversation_starters");
  for (const PersonPhrases& person : summary.per_person_phrases) {
    require_ranked(person.phrases, "per_person_phrases");
  }
  for (const PersonPhrases& person : summary.per_person_phrases_no_stop) {
    require_ranked(person.phrases, "per_person_phrases_no_stop");
  }
}

}  // namespace chat_digest
