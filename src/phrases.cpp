#include "chat_digest/phrases.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <map>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "chat_digest/utf8.hpp"

namespace chat_digest {
namespace {

constexpr std::size_t kMinN = 2;
constexpr std::size_t kMaxN = 4;
constexpr double kPmiThreshold = 0.1;

using TokenIt = std::vector<std::string>::const_iterator;

struct NgramTable {
  std::unordered_map<std::string, std::size_t> index;
  std::vector<PhraseCandidate> entries;
  std::unordered_map<std::string, std::uint64_t> unigrams;
  std::array<std::uint64_t, kMaxN + 1> windows{};
  std::uint64_t total_tokens = 0;
};

const std::vector<std::string>& stream_of(const TokenizedMessage& message, bool filter_stop) {
  return filter_stop ? message.filtered : message.words;
}

std::size_t count_non_stop(const std::vector<std::string>& tokens) {
  return static_cast<std::size_t>(std::count_if(
      tokens.begin(), tokens.end(), [](const std::string& token) { return !is_stop_word(token); }));
}

bool is_phrase_candidate(TokenIt first, TokenIt last) {
  const auto n = static_cast<std::size_t>(last - first);
  std::size_t non_stop = 0;
  std::size_t numeric = 0;
  bool has_long = false;
  std::unordered_set<std::string_view> distinct;
  for (TokenIt it = first; it != last; ++it) {
    if (!is_stop_word(*it)) ++non_stop;
    if (is_numeric_token(*it)) ++numeric;
    if (utf8::length(*it) >= 3) has_long = true;
    distinct.insert(*it);
  }
  if (non_stop == 0 || !has_long) {
    return false;
  }
  if (numeric * 2 > n) {
    return false;
  }
  return distinct.size() > 1;
}

std::string join_tokens(TokenIt first, TokenIt last) {
  std::string out;
  for (TokenIt it = first; it != last; ++it) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += *it;
  }
  return out;
}

void add_ngrams(const std::vector<std::string>& tokens, NgramTable& table) {
  for (const std::string& token : tokens) {
    ++table.unigrams[token];
    ++table.total_tokens;
  }
  for (std::size_t n = kMinN; n <= kMaxN && n <= tokens.size(); ++n) {
    for (std::size_t i = 0; i + n <= tokens.size(); ++i) {
      const TokenIt first = tokens.begin() + static_cast<std::ptrdiff_t>(i);
      const TokenIt last = first + static_cast<std::ptrdiff_t>(n);
      if (!is_phrase_candidate(first, last)) {
        continue;
      }
      std::string phrase = join_tokens(first, last);
      const auto [it, inserted] = table.index.try_emplace(phrase, table.entries.size());
      if (inserted) {
        PhraseCandidate candidate;
        candidate.phrase = std::move(phrase);
        candidate.tokens.assign(first, last);
        candidate.first_seen = table.entries.size();
        table.entries.push_back(std::move(candidate));
      }
      ++table.entries[it->second].count;
      ++table.windows[n];
    }
  }
}

double non_stop_ratio(const PhraseCandidate& candidate) {
  return static_cast<double>(count_non_stop(candidate.tokens)) /
         static_cast<double>(candidate.length());
}

void rank_candidates(std::vector<PhraseCandidate>& candidates) {
  std::sort(candidates.begin(), candidates.end(),
            [](const PhraseCandidate& lhs, const PhraseCandidate& rhs) {
              if (lhs.score != rhs.score) return lhs.score > rhs.score;
              if (lhs.count != rhs.count) return lhs.count > rhs.count;
              if (lhs.length() != rhs.length()) return lhs.length() > rhs.length();
              return lhs.first_seen < rhs.first_seen;
            });
}

std::vector<Count> finish(std::vector<PhraseCandidate> candidates, std::size_t take) {
  rank_candidates(candidates);
  std::vector<PhraseCandidate> kept = suppress_subphrases(std::move(candidates), take * 5);
  if (kept.size() > take) {
    kept.resize(take);
  }
  std::stable_sort(kept.begin(), kept.end(),
                   [](const PhraseCandidate& lhs, const PhraseCandidate& rhs) {
                     if (lhs.count != rhs.count) return lhs.count > rhs.count;
                     return lhs.first_seen < rhs.first_seen;
                   });
  std::vector<Count> out;
  out.reserve(kept.size());
  for (PhraseCandidate& candidate : kept) {
    out.push_back(Count{std::move(candidate.phrase), candidate.count});
  }
  return out;
}

bool contains_run(const std::vector<std::string>& longer, const std::vector<std::string>& shorter) {
  if (shorter.empty() || shorter.size() > longer.size()) {
    return false;
  }
  return std::search(longer.begin(), longer.end(), shorter.begin(), shorter.end()) !=
         longer.end();
}

std::uint64_t min_count_for_messages(std::size_t messages, std::uint64_t floor) {
  if (messages > 100000) return 5;
  if (messages > 10000) return 3;
  return floor;
}

std::uint64_t min_count_for_tokens(std::uint64_t tokens) {
  if (tokens > 500000) return 5;
  if (tokens > 100000) return 4;
  if (tokens > 50000) return 3;
  if (tokens > 10000) return 2;
  return 1;
}

}  // namespace

double repetition_factor(const std::vector<std::string>& tokens) {
  if (tokens.empty()) {
    return 0.0;
  }
  const std::unordered_set<std::string> distinct(tokens.begin(), tokens.end());
  return static_cast<double>(distinct.size()) / static_cast<double>(tokens.size());
}

std::vector<PhraseCandidate> suppress_subphrases(std::vector<PhraseCandidate> ranked,
                                                 std::size_t max_input) {
  if (ranked.size() > max_input) {
    ranked.resize(max_input);
  }

  std::vector<PhraseCandidate> kept;
  for (PhraseCandidate& candidate : ranked) {
    bool absorbed = false;
    for (PhraseCandidate& existing : kept) {
      if (existing.length() > candidate.length() && existing.count >= 2 &&
          contains_run(existing.tokens, candidate.tokens)) {
        absorbed = true;
        break;
      }
      if (candidate.length() > existing.length() && candidate.count >= 2 &&
          contains_run(candidate.tokens, existing.tokens)) {
        const double overlap =
            static_cast<double>(existing.length()) / static_cast<double>(candidate.length());
        if (overlap >= 0.5 && candidate.count * 10 >= existing.count * 6) {
          existing = std::move(candidate);
          absorbed = true;
          break;
        }
      }
    }
    if (!absorbed) {
      kept.push_back(std::move(candidate));
    }
  }
  return kept;
}

std::vector<Count> salient_phrases(const std::vector<TokenizedMessage>& messages,
                                   std::size_t take) {
  if (take == 0) {
    return {};
  }
  NgramTable table;
  for (const TokenizedMessage& message : messages) {
    add_ngrams(message.words, table);
  }
  if (table.total_tokens == 0) {
    return {};
  }

  const std::uint64_t min_count = min_count_for_messages(messages.size(), 2);
  const auto total = static_cast<double>(table.total_tokens);

  std::vector<PhraseCandidate> scored;
  for (PhraseCandidate& candidate : table.entries) {
    if (candidate.count < min_count) {
      continue;
    }
    const std::size_t n = candidate.length();
    double log_independent = 0.0;
    for (const std::string& token : candidate.tokens) {
      log_independent += std::log(static_cast<double>(table.unigrams[token]) / total);
    }
    const double p_phrase =
        static_cast<double>(candidate.count) / static_cast<double>(table.windows[n]);
    const double pmi = std::log(p_phrase) - log_independent;
    if (pmi <= 0.0) {
      continue;
    }
    candidate.score = pmi * static_cast<double>(candidate.count) *
                      std::max(non_stop_ratio(candidate), 0.3) *
                      (1.0 + 0.25 * (static_cast<double>(n) - 2.0)) *
                      repetition_factor(candidate.tokens);
    scored.push_back(std::move(candidate));
  }
  return finish(std::move(scored), take);
}

std::vector<Count> top_phrases(const std::vector<TokenizedMessage>& messages, std::size_t take,
                               bool filter_stop) {
  if (take == 0) {
    return {};
  }
  NgramTable table;
  for (const TokenizedMessage& message : messages) {
    add_ngrams(stream_of(message, filter_stop), table);
  }
  if (table.total_tokens == 0) {
    return {};
  }

  const std::uint64_t min_count = min_count_for_tokens(table.total_tokens);
  const auto total = static_cast<double>(table.total_tokens);

  std::vector<PhraseCandidate> scored;
  for (PhraseCandidate& candidate : table.entries) {
    if (candidate.count < min_count) {
      continue;
    }
    const std::size_t n = candidate.length();
    double independent = 1.0;
    for (const std::string& token : candidate.tokens) {
      independent *= static_cast<double>(table.unigrams[token]) / total;
    }
    const double pmi = std::log2((static_cast<double>(candidate.count) / total) / independent);
    if (!(n >= 4 && candidate.count >= 2) && pmi < kPmiThreshold) {
      continue;
    }
    candidate.score = pmi * static_cast<double>(candidate.count) * static_cast<double>(n * n) *
                      repetition_factor(candidate.tokens);
    scored.push_back(std::move(candidate));
  }
  return finish(std::move(scored), take);
}

std::vector<PersonPhrases> per_person_phrases(const std::vector<TokenizedMessage>& messages,
                                              std::size_t take, bool filter_stop) {
  std::map<std::string, NgramTable> tables;
  for (const TokenizedMessage& message : messages) {
    add_ngrams(stream_of(message, filter_stop), tables[message.source->sender]);
  }

  const std::uint64_t min_count = min_count_for_messages(messages.size(), 1);

  std::vector<PersonPhrases> out;
  out.reserve(tables.size());
  for (auto& [name, table] : tables) {
    PersonPhrases person;
    person.name = name;
    if (take > 0) {
      std::vector<PhraseCandidate> scored;
      for (PhraseCandidate& candidate : table.entries) {
        if (candidate.count < min_count) {
          continue;
        }
        candidate.score = static_cast<double>(candidate.count) *
                          std::pow(static_cast<double>(candidate.length()), 1.6) *
                          std::max(non_stop_ratio(candidate), 0.3) *
                          repetition_factor(candidate.tokens);
        scored.push_back(std::move(candidate));
      }
      person.phrases = finish(std::move(scored), take);
    }
    out.push_back(std::move(person));
  }
  return out;
}

}  // namespace chat_digest
