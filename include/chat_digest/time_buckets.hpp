#pragma once

#include <vector>

#include "chat_digest/message.hpp"
#include "chat_digest/summary.hpp"

namespace chat_digest {

struct TimeBuckets {
  std::vector<Count> daily;       // active days, ascending
  std::vector<HourCount> hourly;  // always 24 entries
  std::vector<Count> timeline;    // every day from first to last, zero-filled
  std::vector<Count> weekly;      // Sun..Sat
  std::vector<Count> monthly;     // "YYYY-MM", ascending
  std::vector<PersonBuckets> by_person;
  std::vector<PersonDaily> per_person_daily;
};

// Buckets every activity message by its local wall-clock time. System events are skipped.
TimeBuckets bucket_messages(const std::vector<Message>& messages);

}  // namespace chat_digest
