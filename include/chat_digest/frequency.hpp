#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "chat_digest/message.hpp"
#include "chat_digest/summary.hpp"
#include "chat_digest/text.hpp"

namespace chat_digest {

// Counts labels while remembering first-occurrence order, so rankings never depend on hash
// iteration order.
class FrequencyCounter {
 public:
  void add(const std::string& label, std::uint64_t amount = 1);

  std::uint64_t count(const std::string& label) const;
  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  // Descending by value, ties by first occurrence. limit == 0 means no limit.
  std::vector<Count> ranked(std::size_t limit = 0) const;

  // Entries in first-occurrence order.
  const std::vector<Count>& entries() const { return entries_; }

 private:
  std::unordered_map<std::string, std::size_t> index_;
  std::vector<Count> entries_;
};

// Stable descending sort by value.
void rank_counts(std::vector<Count>& counts);

// Activity messages per sender.
std::vector<Count> count_by_sender(const std::vector<Message>& messages);

// filter_stop selects the stop-word filtered stream. Purely alphanumeric tokens shorter than
// three characters are skipped.
std::vector<Count> top_words(const std::vector<TokenizedMessage>& messages, std::size_t take,
                             bool filter_stop);

std::vector<Count> word_cloud(const std::vector<TokenizedMessage>& messages, std::size_t take,
                              bool filter_stop);

std::vector<Count> top_emojis(const std::vector<TokenizedMessage>& messages, std::size_t take);

std::vector<Count> emoji_cloud(const std::vector<TokenizedMessage>& messages, std::size_t take);

}  // namespace chat_digest
