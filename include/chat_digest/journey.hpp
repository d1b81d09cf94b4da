#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "chat_digest/civil_time.hpp"
#include "chat_digest/message.hpp"
#include "chat_digest/sentiment.hpp"
#include "chat_digest/summary.hpp"

namespace chat_digest {

struct JourneyOptions {
  std::int64_t gap_minutes = 30;
  std::size_t max_moments = 4;
  std::int64_t min_moment_spacing_days = 7;
  std::size_t excerpt_size = 5;
};

// Activity on one calendar day.
struct DailyAggregate {
  CivilDate date;
  std::int64_t day_number = 0;
  std::uint64_t messages = 0;
  std::uint64_t scored = 0;        // messages with a sentiment score
  double mean_sentiment = 0.0;     // 0 when nothing was scored
};

enum class MomentSignal { SentimentPeak, SentimentDip, VolumeSpike };

struct DayScore {
  std::size_t day = 0;  // index into the aggregates
  MomentSignal signal = MomentSignal::SentimentPeak;
  double score = 0.0;   // signed for sentiment, positive for volume
};

// scores must be parallel to messages. System events are skipped.
std::vector<DailyAggregate> daily_aggregates(
    const std::vector<Message>& messages,
    const std::vector<std::optional<SentimentScore>>& scores);

// Every day that stands out. A day is a volume spike when its count is at least twice the
// mean of the previous seven active days (three days of baseline needed); its score is
// 1 - baseline / count. A day is a sentiment peak or dip when its mean is a strict local
// extremum against the neighbouring scored days and |mean| >= 0.3.
std::vector<DayScore> score_days(const std::vector<DailyAggregate>& days);

// Top max_moments by |score| (ties earliest) keeping picks at least min_spacing_days apart,
// returned in date order.
std::vector<DayScore> select_moments(std::vector<DayScore> scored,
                                     const std::vector<DailyAggregate>& days,
                                     std::size_t max_moments, std::int64_t min_spacing_days);

// Author of the first "You deleted this message", else the sender with the fewest activity
// messages (ties by name). Empty when there are no senders.
std::string likely_you(const std::vector<Message>& messages);

// nullopt when there is no activity message.
std::optional<Journey> build_journey(const std::vector<Message>& messages,
                                     const std::vector<std::optional<SentimentScore>>& scores,
                                     const JourneyOptions& options);

}  // namespace chat_digest
