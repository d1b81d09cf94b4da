#include "chat_digest/sentiment.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

#include "chat_digest/text.hpp"

namespace chat_digest {
namespace {

constexpr double kNegationScalar = -0.74;
constexpr double kBoost = 1.293;
constexpr double kDampen = 0.707;
constexpr std::size_t kNegationWindow = 3;
constexpr double kNeutralBand = 0.05;

using WordSet = std::unordered_set<std::string_view>;

const WordSet& positive_words() {
  static const WordSet kWords = {
      "love",    "loving", "loved",  "like",      "great",   "good",    "amazing", "awesome",
      "fantastic", "nice", "cool",   "fun",       "yay",     "happy",   "glad",    "thanks",
      "thank",   "thx",    "congrats", "winner",  "win",     "excited", "sweet",   "wow",
      "perfect", "best",   "brilliant", "enjoy",  "enjoying", "haha",   "lol",     "lmao",
      "pls",     "plz",    "support", "proud",    "celebrate"};
  return kWords;
}

const WordSet& negative_words() {
  static const WordSet kWords = {
      "hate",  "hating", "hated",   "bad",    "terrible", "awful", "horrible", "worst",
      "sad",   "angry",  "mad",     "upset",  "tired",    "annoyed", "pain",   "hurt",
      "broken", "break", "breakup", "cry",    "crying",   "sucks", "suck",     "wtf",
      "meh",   "lame",   "loser",   "lost",   "problem",  "issues", "issue",   "sorry",
      "ugh"};
  return kWords;
}

const WordSet& negators() {
  static const WordSet kWords = {
      "not",     "no",     "never",   "nope",    "cannot", "can't",  "cant",     "don't",
      "dont",    "didn't", "didnt",   "doesn't", "doesnt", "isn't",  "isnt",     "wasn't",
      "wasnt",   "won't",  "wont",    "aren't",  "arent",  "couldn't", "wouldn't", "shouldn't",
      "neither", "nor",    "nothing", "nobody",  "without"};
  return kWords;
}

const WordSet& boosters() {
  static const WordSet kWords = {
      "absolutely", "amazingly", "awfully",    "completely", "decidedly", "deeply",
      "enormously", "entirely",  "especially", "extremely",  "fabulously", "highly",
      "incredibly", "intensely", "really",     "remarkably", "so",         "thoroughly",
      "totally",    "tremendously", "uber",    "unbelievably", "utterly",  "very",
      "super"};
  return kWords;
}

const WordSet& dampeners() {
  static const WordSet kWords = {
      "almost", "barely", "hardly",   "kinda",    "less",     "little",
      "marginally", "occasionally", "partly", "scarcely", "slightly", "somewhat"};
  return kWords;
}

const WordSet& positive_emojis() {
  static const WordSet kEmojis = {
      "\xF0\x9F\x98\x80", "\xF0\x9F\x98\x83", "\xF0\x9F\x98\x84", "\xF0\x9F\x98\x81",
      "\xF0\x9F\x98\x86", "\xF0\x9F\x98\x8D", "\xF0\x9F\x98\x8A", "\xF0\x9F\x98\x82",
      "\xF0\x9F\xA4\xA3", "\xF0\x9F\x91\x8D", "\xF0\x9F\x99\x8F", "\xE2\x9D\xA4\xEF\xB8\x8F",
      "\xE2\x9D\xA4"};
  return kEmojis;
}

const WordSet& negative_emojis() {
  static const WordSet kEmojis = {
      "\xF0\x9F\x98\xA2", "\xF0\x9F\x98\xAD", "\xF0\x9F\x98\xA1", "\xF0\x9F\x98\xA0",
      "\xF0\x9F\x91\x8E", "\xF0\x9F\x92\x94", "\xF0\x9F\x98\x9E", "\xF0\x9F\x98\x94",
      "\xF0\x9F\x99\x81", "\xE2\x98\xB9\xEF\xB8\x8F", "\xE2\x98\xB9"};
  return kEmojis;
}

double word_valence(std::string_view token) {
  if (positive_words().count(token) > 0) return 1.0;
  if (negative_words().count(token) > 0) return -1.0;
  return 0.0;
}

bool negated(const std::vector<std::string>& tokens, std::size_t i) {
  const std::size_t start = i > kNegationWindow ? i - kNegationWindow : 0;
  for (std::size_t j = start; j < i; ++j) {
    if (negators().count(tokens[j]) > 0) {
      return true;
    }
  }
  return false;
}

struct Accumulator {
  double sum = 0.0;
  std::uint64_t pos = 0;
  std::uint64_t neu = 0;
  std::uint64_t neg = 0;

  void push(const SentimentScore& score) {
    sum += score.compound;
    switch (score.label) {
      case SentimentClass::Positive:
        ++pos;
        break;
      case SentimentClass::Neutral:
        ++neu;
        break;
      case SentimentClass::Negative:
        ++neg;
        break;
    }
  }

  double mean() const {
    const std::uint64_t count = pos + neu + neg;
    if (count == 0) {
      return 0.0;
    }
    return std::clamp(sum / static_cast<double>(count), -1.0, 1.0);
  }
};

}  // namespace

std::string_view sentiment_class_name(SentimentClass label) {
  switch (label) {
    case SentimentClass::Positive:
      return "positive";
    case SentimentClass::Neutral:
      return "neutral";
    case SentimentClass::Negative:
      return "negative";
  }
  return "neutral";
}

SentimentClass classify_sentiment(double compound) {
  if (compound > kNeutralBand) {
    return SentimentClass::Positive;
  }
  if (compound < -kNeutralBand) {
    return SentimentClass::Negative;
  }
  return SentimentClass::Neutral;
}

SentimentScore score_text(std::string_view text) {
  const std::vector<std::string> tokens = tokenize(text);

  double sum = 0.0;
  std::size_t hits = 0;
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    double valence = word_valence(tokens[i]);
    if (valence == 0.0) {
      continue;
    }
    if (i > 0) {
      if (boosters().count(tokens[i - 1]) > 0) {
        valence *= kBoost;
      } else if (dampeners().count(tokens[i - 1]) > 0) {
        valence *= kDampen;
      }
    }
    if (negated(tokens, i)) {
      valence *= kNegationScalar;
    }
    sum += valence;
    ++hits;
  }

  for (const std::string& emoji : extract_emojis(text)) {
    if (positive_emojis().count(emoji) > 0) {
      sum += 1.0;
      ++hits;
    } else if (negative_emojis().count(emoji) > 0) {
      sum -= 1.0;
      ++hits;
    }
  }

  SentimentScore score;
  score.hits = hits;
  if (hits > 0) {
    score.compound = std::clamp(sum / static_cast<double>(hits), -1.0, 1.0);
  }
  score.label = classify_sentiment(score.compound);
  return score;
}

std::vector<std::optional<SentimentScore>> score_messages(const std::vector<Message>& messages) {
  std::vector<std::optional<SentimentScore>> scores;
  scores.reserve(messages.size());
  for (const Message& message : messages) {
    if (message.kind == MessageKind::Normal) {
      scores.emplace_back(score_text(message.body));
    } else {
      scores.emplace_back(std::nullopt);
    }
  }
  return scores;
}

SentimentBreakdown sentiment_breakdown(const std::vector<Message>& messages,
                                       const std::vector<std::optional<SentimentScore>>& scores,
                                       const std::vector<Count>& by_sender) {
  if (scores.size() != messages.size()) {
    throw std::invalid_argument("sentiment scores must be parallel to messages");
  }

  std::map<std::pair<std::string, std::string>, Accumulator> per_day;
  std::map<std::string, Accumulator> per_person;
  for (const Count& sender : by_sender) {
    per_person[sender.label];
  }

  for (std::size_t i = 0; i < messages.size(); ++i) {
    if (!scores[i]) {
      continue;
    }
    const Message& message = messages[i];
    per_day[{format_iso_date(message.timestamp.date), message.sender}].push(*scores[i]);
    per_person[message.sender].push(*scores[i]);
  }

  SentimentBreakdown breakdown;
  breakdown.by_day.reserve(per_day.size());
  for (const auto& [key, acc] : per_day) {
    breakdown.by_day.push_back(SentimentDay{key.second, key.first, acc.mean(), acc.pos, acc.neu,
                                            acc.neg});
  }

  breakdown.overall.reserve(per_person.size());
  for (const auto& [name, acc] : per_person) {
    breakdown.overall.push_back(SentimentOverall{name, acc.mean(), acc.pos, acc.neu, acc.neg});
  }
  std::stable_sort(breakdown.overall.begin(), breakdown.overall.end(),
                   [](const SentimentOverall& lhs, const SentimentOverall& rhs) {
                     return lhs.mean > rhs.mean;
                   });
  return breakdown;
}

}  // namespace chat_digest
