#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "chat_digest/summary.hpp"

namespace chat_digest {

struct AnalyzeOptions {
  std::size_t top_words_n = 10;
  std::size_t top_emojis_n = 10;
  std::size_t word_cloud_size = 150;
  std::size_t emoji_cloud_size = 200;
  std::size_t phrase_count = 20;
  std::size_t per_person_phrase_count = 10;
  std::int64_t conversation_gap_minutes = 30;
  std::size_t max_moments = 4;
};

class ChatAnalyzer {
 public:
  // Throws std::invalid_argument for a conversation gap outside
  // [0, kMaxConversationGapMinutes].
  explicit ChatAnalyzer(AnalyzeOptions options = {});

  // Parses and aggregates one export. Throws AnalysisError; never returns a partial Summary.
  Summary analyze(std::string_view raw_text) const;

  const AnalyzeOptions& options() const { return options_; }

 private:
  AnalyzeOptions options_;
};

// ChatAnalyzer with default options apart from the two list sizes.
Summary analyze(std::string_view raw_text, std::size_t top_words_n, std::size_t top_emojis_n);

// Checks the cross-field invariants of a finished Summary and throws AnalysisError with
// ErrorKind::InternalInvariantViolation on the first mismatch.
void validate_summary(const Summary& summary);

}  // namespace chat_digest
