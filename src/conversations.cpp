#include "chat_digest/conversations.hpp"

#include <stdexcept>

#include "chat_digest/frequency.hpp"

namespace chat_digest {

ConversationStats conversation_starters(const std::vector<Message>& messages,
                                        std::int64_t gap_minutes) {
  if (gap_minutes < 0 || gap_minutes > kMaxConversationGapMinutes) {
    throw std::invalid_argument("conversation gap is out of range");
  }
  const std::int64_t gap_seconds = gap_minutes * 60;

  FrequencyCounter starters;
  ConversationStats stats;
  const Message* previous = nullptr;
  for (const Message& message : messages) {
    if (!message.is_activity()) {
      continue;
    }
    if (previous == nullptr || message.epoch_seconds - previous->epoch_seconds > gap_seconds) {
      starters.add(message.sender);
      ++stats.conversation_count;
    }
    previous = &message;
  }

  stats.starters = starters.ranked();
  return stats;
}

}  // namespace chat_digest
