#include "chat_digest/person_stats.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <unordered_map>
#include <utility>

#include "chat_digest/frequency.hpp"

namespace chat_digest {
namespace {

constexpr std::size_t kFunFactEmojis = 3;
constexpr std::size_t kPersonStatEmojis = 10;

struct PersonTally {
  std::string name;
  std::uint64_t counted_messages = 0;
  std::uint64_t total_words = 0;
  std::uint64_t longest_message_words = 0;
  FrequencyCounter words;
  FrequencyCounter emojis;
  FrequencyCounter colors;

  double average_words() const {
    if (counted_messages == 0) {
      return 0.0;
    }
    return static_cast<double>(total_words) / static_cast<double>(counted_messages);
  }
};

std::vector<PersonTally> tally(const std::vector<TokenizedMessage>& messages,
                               const std::vector<Count>& by_sender) {
  std::vector<PersonTally> people;
  std::unordered_map<std::string, std::size_t> index;
  people.reserve(by_sender.size());
  for (const Count& sender : by_sender) {
    index.emplace(sender.label, people.size());
    PersonTally person;
    person.name = sender.label;
    people.push_back(std::move(person));
  }

  for (const TokenizedMessage& message : messages) {
    const auto found = index.find(message.source->sender);
    if (found == index.end() || message.media_placeholder) {
      continue;
    }
    PersonTally& person = people[found->second];
    ++person.counted_messages;
    person.total_words += message.words.size();
    person.longest_message_words =
        std::max<std::uint64_t>(person.longest_message_words, message.words.size());
    for (const std::string& word : message.words) {
      person.words.add(word);
      if (color_hex_for_word(word)) {
        person.colors.add(word);
      }
    }
    for (const std::string& emoji : message.emojis) {
      person.emojis.add(emoji);
    }
  }
  return people;
}

template <typename Row>
void rank_by_total_words(std::vector<Row>& rows) {
  std::stable_sort(rows.begin(), rows.end(), [](const Row& lhs, const Row& rhs) {
    return lhs.total_words > rhs.total_words;
  });
}

}  // namespace

std::optional<std::string> pick_dominant_color(const std::vector<Count>& color_words) {
  const Count* best = nullptr;
  for (const Count& word : color_words) {
    if (word.value == 0) {
      continue;
    }
    if (best == nullptr || word.value > best->value ||
        (word.value == best->value && word.label < best->label)) {
      best = &word;
    }
  }
  if (best == nullptr) {
    return std::nullopt;
  }
  const std::optional<std::string_view> hex = color_hex_for_word(best->label);
  if (!hex) {
    return std::nullopt;
  }
  return std::string(*hex);
}

std::vector<FunFact> fun_facts(const std::vector<TokenizedMessage>& messages,
                               const std::vector<Count>& by_sender) {
  std::vector<FunFact> facts;
  for (const PersonTally& person : tally(messages, by_sender)) {
    FunFact fact;
    fact.name = person.name;
    fact.total_words = person.total_words;
    fact.longest_message_words = person.longest_message_words;
    fact.unique_words = static_cast<std::uint64_t>(
        std::count_if(person.words.entries().begin(), person.words.entries().end(),
                      [](const Count& word) { return word.value == 1; }));
    fact.average_message_length = static_cast<std::uint64_t>(std::llround(person.average_words()));
    for (const Count& emoji : person.emojis.ranked(kFunFactEmojis)) {
      fact.top_emojis.push_back(emoji.label);
    }
    facts.push_back(std::move(fact));
  }
  rank_by_total_words(facts);
  return facts;
}

std::vector<PersonStat> person_stats(const std::vector<TokenizedMessage>& messages,
                                     const std::vector<Count>& by_sender) {
  std::vector<PersonStat> stats;
  for (const PersonTally& person : tally(messages, by_sender)) {
    PersonStat stat;
    stat.name = person.name;
    stat.total_words = person.total_words;
    stat.unique_words = person.words.size();
    stat.longest_message_words = person.longest_message_words;
    stat.average_words_per_message = person.average_words();
    stat.top_emojis = person.emojis.ranked(kPersonStatEmojis);
    stat.dominant_color = pick_dominant_color(person.colors.entries());
    stats.push_back(std::move(stat));
  }
  rank_by_total_words(stats);
  return stats;
}

}  // namespace chat_digest
