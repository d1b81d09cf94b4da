#include "chat_digest/journey.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>
#include <utility>

#include "chat_digest/conversations.hpp"
#include "chat_digest/utf8.hpp"

namespace chat_digest {
namespace {

constexpr std::size_t kMinMessagesForMoments = 10;
constexpr std::size_t kMinDaysForMoments = 3;
constexpr std::size_t kBaselineDays = 7;
constexpr std::size_t kMinBaselineDays = 3;
constexpr double kSpikeRatio = 2.0;
constexpr double kMinSentimentMagnitude = 0.3;
constexpr std::size_t kContextRadius = 2;
constexpr std::size_t kMeaningfulLength = 200;

JourneyMessage to_journey_message(const Message& message, const std::string& you) {
  JourneyMessage out;
  out.sender = message.sender;
  out.text = message.body;
  out.timestamp = format_iso_datetime(message.timestamp);
  out.is_you = !you.empty() && message.sender == you;
  return out;
}

std::vector<std::size_t> activity_indices(const std::vector<Message>& messages) {
  std::vector<std::size_t> out;
  out.reserve(messages.size());
  for (std::size_t i = 0; i < messages.size(); ++i) {
    if (messages[i].is_activity()) {
      out.push_back(i);
    }
  }
  return out;
}

double compound_at(const std::vector<std::optional<SentimentScore>>& scores, std::size_t index) {
  return scores[index] ? scores[index]->compound : 0.0;
}

// Position in `activity` of the message that best represents the moment.
std::size_t pick_anchor(const std::vector<Message>& messages,
                        const std::vector<std::optional<SentimentScore>>& scores,
                        const std::vector<std::size_t>& activity, const CivilDate& date,
                        MomentSignal signal) {
  std::optional<std::size_t> best;
  std::optional<std::size_t> first_of_day;
  for (std::size_t k = 0; k < activity.size(); ++k) {
    const std::size_t index = activity[k];
    if (messages[index].timestamp.date != date) {
      continue;
    }
    if (!first_of_day) {
      first_of_day = k;
    }
    if (!scores[index]) {
      continue;
    }
    if (!best) {
      best = k;
      continue;
    }
    const std::size_t current = activity[*best];
    switch (signal) {
      case MomentSignal::SentimentPeak:
        if (compound_at(scores, index) > compound_at(scores, current)) best = k;
        break;
      case MomentSignal::SentimentDip:
        if (compound_at(scores, index) < compound_at(scores, current)) best = k;
        break;
      case MomentSignal::VolumeSpike:
        if (utf8::length(messages[index].body) > utf8::length(messages[current].body)) best = k;
        break;
    }
  }
  if (best) {
    return *best;
  }
  if (first_of_day) {
    return *first_of_day;
  }
  throw std::logic_error("moment day has no activity message");
}

std::string moment_title(MomentSignal signal, const Message& anchor, double sentiment) {
  if (signal == MomentSignal::VolumeSpike) {
    return "A busy day";
  }
  if (sentiment > kMinSentimentMagnitude) {
    return "A joyful moment";
  }
  if (sentiment < -kMinSentimentMagnitude) {
    return "A heartfelt exchange";
  }
  if (anchor.body.find('?') != std::string::npos) {
    return "A curious conversation";
  }
  if (utf8::length(anchor.body) > kMeaningfulLength) {
    return "A meaningful message";
  }
  return "A memorable moment";
}

}  // namespace

std::vector<DailyAggregate> daily_aggregates(
    const std::vector<Message>& messages,
    const std::vector<std::optional<SentimentScore>>& scores) {
  if (scores.size() != messages.size()) {
    throw std::invalid_argument("sentiment scores must be parallel to messages");
  }

  std::map<std::int64_t, std::pair<DailyAggregate, double>> by_day;
  for (std::size_t i = 0; i < messages.size(); ++i) {
    const Message& message = messages[i];
    if (!message.is_activity()) {
      continue;
    }
    const std::int64_t day_number = days_from_civil(message.timestamp.date);
    auto& [aggregate, sum] = by_day[day_number];
    aggregate.date = message.timestamp.date;
    aggregate.day_number = day_number;
    ++aggregate.messages;
    if (scores[i]) {
      ++aggregate.scored;
      sum += scores[i]->compound;
    }
  }

  std::vector<DailyAggregate> days;
  days.reserve(by_day.size());
  for (auto& [day_number, entry] : by_day) {
    DailyAggregate aggregate = entry.first;
    if (aggregate.scored > 0) {
      aggregate.mean_sentiment = entry.second / static_cast<double>(aggregate.scored);
    }
    days.push_back(aggregate);
  }
  return days;
}

std::vector<DayScore> score_days(const std::vector<DailyAggregate>& days) {
  std::vector<DayScore> scored;

  for (std::size_t i = kMinBaselineDays; i < days.size(); ++i) {
    const std::size_t from = i > kBaselineDays ? i - kBaselineDays : 0;
    double baseline = 0.0;
    for (std::size_t j = from; j < i; ++j) {
      baseline += static_cast<double>(days[j].messages);
    }
    baseline /= static_cast<double>(i - from);
    const auto count = static_cast<double>(days[i].messages);
    if (baseline > 0.0 && count >= kSpikeRatio * baseline) {
      scored.push_back(DayScore{i, MomentSignal::VolumeSpike, 1.0 - baseline / count});
    }
  }

  std::vector<std::size_t> with_sentiment;
  for (std::size_t i = 0; i < days.size(); ++i) {
    if (days[i].scored > 0) {
      with_sentiment.push_back(i);
    }
  }
  for (std::size_t k = 0; k < with_sentiment.size(); ++k) {
    const double mean = days[with_sentiment[k]].mean_sentiment;
    if (std::fabs(mean) < kMinSentimentMagnitude) {
      continue;
    }
    bool has_neighbour = false;
    bool above_all = true;
    bool below_all = true;
    if (k > 0) {
      const double prev = days[with_sentiment[k - 1]].mean_sentiment;
      has_neighbour = true;
      above_all = above_all && mean > prev;
      below_all = below_all && mean < prev;
    }
    if (k + 1 < with_sentiment.size()) {
      const double next = days[with_sentiment[k + 1]].mean_sentiment;
      has_neighbour = true;
      above_all = above_all && mean > next;
      below_all = below_all && mean < next;
    }
    if (!has_neighbour) {
      continue;
    }
    if (mean > 0.0 && above_all) {
      scored.push_back(DayScore{with_sentiment[k], MomentSignal::SentimentPeak, mean});
    } else if (mean < 0.0 && below_all) {
      scored.push_back(DayScore{with_sentiment[k], MomentSignal::SentimentDip, mean});
    }
  }

  std::sort(scored.begin(), scored.end(), [](const DayScore& lhs, const DayScore& rhs) {
    if (lhs.day != rhs.day) return lhs.day < rhs.day;
    return lhs.signal < rhs.signal;
  });
  return scored;
}

std::vector<DayScore> select_moments(std::vector<DayScore> scored,
                                     const std::vector<DailyAggregate>& days,
                                     std::size_t max_moments, std::int64_t min_spacing_days) {
  std::stable_sort(scored.begin(), scored.end(), [](const DayScore& lhs, const DayScore& rhs) {
    const double left = std::fabs(lhs.score);
    const double right = std::fabs(rhs.score);
    if (left != right) return left > right;
    return lhs.day < rhs.day;
  });

  std::vector<DayScore> selected;
  for (const DayScore& candidate : scored) {
    if (selected.size() >= max_moments) {
      break;
    }
    if (candidate.day >= days.size()) {
      throw std::out_of_range("moment refers to an unknown day");
    }
    const std::int64_t day_number = days[candidate.day].day_number;
    const bool too_close =
        std::any_of(selected.begin(), selected.end(), [&](const DayScore& picked) {
          const std::int64_t distance = day_number - days[picked.day].day_number;
          return (distance < 0 ? -distance : distance) < min_spacing_days;
        });
    if (!too_close) {
      selected.push_back(candidate);
    }
  }

  std::sort(selected.begin(), selected.end(),
            [](const DayScore& lhs, const DayScore& rhs) { return lhs.day < rhs.day; });
  return selected;
}

std::string likely_you(const std::vector<Message>& messages) {
  for (const Message& message : messages) {
    if (message.kind == MessageKind::DeletedByAuthor && !message.sender.empty()) {
      return message.sender;
    }
  }

  std::map<std::string, std::uint64_t> counts;
  for (const Message& message : messages) {
    if (message.is_activity()) {
      ++counts[message.sender];
    }
  }
  const std::pair<const std::string, std::uint64_t>* fewest = nullptr;
  for (const auto& entry : counts) {
    if (fewest == nullptr || entry.second < fewest->second) {
      fewest = &entry;
    }
  }
  return fewest == nullptr ? std::string() : fewest->first;
}

std::optional<Journey> build_journey(const std::vector<Message>& messages,
                                     const std::vector<std::optional<SentimentScore>>& scores,
                                     const JourneyOptions& options) {
  if (scores.size() != messages.size()) {
    throw std::invalid_argument("sentiment scores must be parallel to messages");
  }
  if (options.gap_minutes < 0 || options.gap_minutes > kMaxConversationGapMinutes) {
    throw std::invalid_argument("conversation gap is out of range");
  }
  const std::vector<std::size_t> activity = activity_indices(messages);
  if (activity.empty()) {
    return std::nullopt;
  }

  const std::string you = likely_you(messages);
  const std::int64_t gap_seconds = options.gap_minutes * 60;
  const auto gap_between = [&](std::size_t k) {
    return messages[activity[k + 1]].epoch_seconds - messages[activity[k]].epoch_seconds;
  };

  const Message& first = messages[activity.front()];
  const Message& last = messages[activity.back()];

  Journey journey;
  journey.first_day = format_long_date(first.timestamp.date);
  journey.last_day = format_long_date(last.timestamp.date);
  journey.total_days = static_cast<std::uint64_t>(
      std::max<std::int64_t>(1, days_from_civil(last.timestamp.date) -
                                    days_from_civil(first.timestamp.date)));
  journey.total_messages = activity.size();

  const std::size_t excerpt = options.excerpt_size;
  for (std::size_t k = 0; k < activity.size() && journey.first_messages.size() < excerpt; ++k) {
    journey.first_messages.push_back(to_journey_message(messages[activity[k]], you));
    if (k + 1 < activity.size() && gap_between(k) > gap_seconds) {
      break;
    }
  }

  for (std::size_t k = activity.size(); k > 0 && journey.last_messages.size() < excerpt; --k) {
    journey.last_messages.push_back(to_journey_message(messages[activity[k - 1]], you));
    if (k > 1 && gap_between(k - 2) > gap_seconds) {
      break;
    }
  }
  std::reverse(journey.last_messages.begin(), journey.last_messages.end());

  const std::vector<DailyAggregate> days = daily_aggregates(messages, scores);
  if (activity.size() < kMinMessagesForMoments || days.size() < kMinDaysForMoments) {
    return journey;
  }

  const std::vector<DayScore> picked = select_moments(
      score_days(days), days, options.max_moments, options.min_moment_spacing_days);
  for (const DayScore& pick : picked) {
    const DailyAggregate& day = days[pick.day];
    const std::size_t anchor_pos = pick_anchor(messages, scores, activity, day.date, pick.signal);
    const Message& anchor = messages[activity[anchor_pos]];
    const double sentiment = compound_at(scores, activity[anchor_pos]);

    JourneyMoment moment;
    moment.title = moment_title(pick.signal, anchor, sentiment);
    moment.description = "On " + format_long_datetime(anchor.timestamp);
    moment.date = format_iso_date(day.date);
    moment.sentiment_score = sentiment;

    const std::size_t begin = anchor_pos > kContextRadius ? anchor_pos - kContextRadius : 0;
    const std::size_t end = std::min(activity.size(), anchor_pos + kContextRadius + 1);
    for (std::size_t k = begin; k < end; ++k) {
      moment.messages.push_back(to_journey_message(messages[activity[k]], you));
    }
    journey.interesting_moments.push_back(std::move(moment));
  }
  return journey;
}

}  // namespace chat_digest
