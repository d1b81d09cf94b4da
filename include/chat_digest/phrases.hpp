#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "chat_digest/summary.hpp"
#include "chat_digest/text.hpp"

namespace chat_digest {

struct PhraseCandidate {
  std::string phrase;
  std::vector<std::string> tokens;
  std::uint64_t count = 0;
  double score = 0.0;
  std::size_t first_seen = 0;  // order of first appearance in its n-gram table

  std::size_t length() const { return tokens.size(); }
};

// distinct tokens / n. 1.0 for an n-gram without repeats, 1/n for "ha ha ha".
double repetition_factor(const std::vector<std::string>& tokens);

// Walks score-ranked candidates (only the first max_input of them) and keeps distinct phrases:
// - a candidate contained in a kept longer phrase whose count is >= 2 is dropped;
// - a longer candidate with count >= 2 replaces a kept phrase it contains when the kept phrase
//   covers at least half of it and the candidate count is at least 60% of the kept count.
std::vector<PhraseCandidate> suppress_subphrases(std::vector<PhraseCandidate> ranked,
                                                 std::size_t max_input);

// PMI-weighted phrases over the unfiltered stream.
std::vector<Count> salient_phrases(const std::vector<TokenizedMessage>& messages,
                                   std::size_t take);

// log2 PMI x count x n^2. filter_stop selects the stop-word filtered stream.
std::vector<Count> top_phrases(const std::vector<TokenizedMessage>& messages, std::size_t take,
                               bool filter_stop);

// count x n^1.6 x non-stop ratio, per sender, ordered by sender name.
std::vector<PersonPhrases> per_person_phrases(const std::vector<TokenizedMessage>& messages,
                                              std::size_t take, bool filter_stop);

}  // namespace chat_digest
