#include "chat_digest/frequency.hpp"

#include <algorithm>

#include "chat_digest/utf8.hpp"

namespace chat_digest {
namespace {

bool is_short_alphanumeric(const std::string& token) {
  if (utf8::length(token) >= 3) {
    return false;
  }
  for (const char32_t cp : utf8::decode(token)) {
    if (!utf8::is_alphanumeric(cp)) {
      return false;
    }
  }
  return true;
}

FrequencyCounter count_emojis(const std::vector<TokenizedMessage>& messages) {
  FrequencyCounter counter;
  for (const TokenizedMessage& message : messages) {
    for (const std::string& emoji : message.emojis) {
      counter.add(emoji);
    }
  }
  return counter;
}

}  // namespace

void FrequencyCounter::add(const std::string& label, std::uint64_t amount) {
  const auto [it, inserted] = index_.try_emplace(label, entries_.size());
  if (inserted) {
    entries_.push_back(Count{label, 0});
  }
  entries_[it->second].value += amount;
}

std::uint64_t FrequencyCounter::count(const std::string& label) const {
  const auto it = index_.find(label);
  return it == index_.end() ? 0 : entries_[it->second].value;
}

std::vector<Count> FrequencyCounter::ranked(std::size_t limit) const {
  std::vector<Count> out = entries_;
  rank_counts(out);
  if (limit != 0 && out.size() > limit) {
    out.resize(limit);
  }
  return out;
}

void rank_counts(std::vector<Count>& counts) {
  std::stable_sort(counts.begin(), counts.end(),
                   [](const Count& lhs, const Count& rhs) { return lhs.value > rhs.value; });
}

std::vector<Count> count_by_sender(const std::vector<Message>& messages) {
  FrequencyCounter counter;
  for (const Message& message : messages) {
    if (message.is_activity()) {
      counter.add(message.sender);
    }
  }
  return counter.ranked();
}

std::vector<Count> top_words(const std::vector<TokenizedMessage>& messages, std::size_t take,
                             bool filter_stop) {
  if (take == 0) {
    return {};
  }
  FrequencyCounter counter;
  for (const TokenizedMessage& message : messages) {
    for (const std::string& token : filter_stop ? message.filtered : message.words) {
      if (!is_short_alphanumeric(token)) {
        counter.add(token);
      }
    }
  }
  return counter.ranked(take);
}

std::vector<Count> word_cloud(const std::vector<TokenizedMessage>& messages, std::size_t take,
                              bool filter_stop) {
  if (take == 0) {
    return {};
  }
  FrequencyCounter counter;
  for (const TokenizedMessage& message : messages) {
    for (const std::string& token : filter_stop ? message.filtered : message.words) {
      counter.add(token);
    }
  }
  return counter.ranked(take);
}

std::vector<Count> top_emojis(const std::vector<TokenizedMessage>& messages, std::size_t take) {
  if (take == 0) {
    return {};
  }
  return count_emojis(messages).ranked(take);
}

std::vector<Count> emoji_cloud(const std::vector<TokenizedMessage>& messages, std::size_t take) {
  return top_emojis(messages, take);
}

}  // namespace chat_digest
