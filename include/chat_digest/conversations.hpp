#pragma once

#include <cstdint>
#include <vector>

#include "chat_digest/message.hpp"
#include "chat_digest/summary.hpp"

namespace chat_digest {

// A century of minutes; larger gaps would overflow once converted to seconds.
inline constexpr std::int64_t kMaxConversationGapMinutes = 60 * 24 * 366 * 100;

struct ConversationStats {
  std::vector<Count> starters;  // ranked, ties by first start
  std::uint64_t conversation_count = 0;
};

// A conversation starts at the first activity message and again after every gap strictly
// longer than gap_minutes. System events are ignored. messages must be in timestamp order.
// Throws std::invalid_argument when gap_minutes is outside [0, kMaxConversationGapMinutes].
ConversationStats conversation_starters(const std::vector<Message>& messages,
                                        std::int64_t gap_minutes);

}  // namespace chat_digest
