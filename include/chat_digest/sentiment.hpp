#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "chat_digest/message.hpp"
#include "chat_digest/summary.hpp"

namespace chat_digest {

enum class SentimentClass { Positive, Neutral, Negative };

std::string_view sentiment_class_name(SentimentClass label);

// > 0.05 positive, < -0.05 negative, otherwise neutral.
SentimentClass classify_sentiment(double compound);

struct SentimentScore {
  double compound = 0.0;  // always within [-1, 1]
  SentimentClass label = SentimentClass::Neutral;
  std::size_t hits = 0;   // lexicon words and emojis that carried valence
};

// Lexicon score of a single text. Negators flip the next three tokens, boosters and
// dampeners scale the word right after them. No hits scores 0.
SentimentScore score_text(std::string_view text);

// One entry per message, engaged only for Normal messages.
std::vector<std::optional<SentimentScore>> score_messages(const std::vector<Message>& messages);

struct SentimentBreakdown {
  std::vector<SentimentDay> by_day;        // by day, then name
  std::vector<SentimentOverall> overall;   // by mean descending, then name
};

// scores must be parallel to messages. Every sender in by_sender gets an overall row, even
// one with no scored message.
SentimentBreakdown sentiment_breakdown(const std::vector<Message>& messages,
                                       const std::vector<std::optional<SentimentScore>>& scores,
                                       const std::vector<Count>& by_sender);

}  // namespace chat_digest
