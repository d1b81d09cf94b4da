#pragma once

#include <optional>
#include <string>
#include <vector>

#include "chat_digest/summary.hpp"
#include "chat_digest/text.hpp"

namespace chat_digest {

// Hex of the most used colour word, ties broken alphabetically by word. nullopt when no
// colour word was used.
std::optional<std::string> pick_dominant_color(const std::vector<Count>& color_words);

// One entry per sender in by_sender, ordered by total words descending. Media placeholders do
// not count as messages for the averages.
std::vector<FunFact> fun_facts(const std::vector<TokenizedMessage>& messages,
                               const std::vector<Count>& by_sender);

std::vector<PersonStat> person_stats(const std::vector<TokenizedMessage>& messages,
                                     const std::vector<Count>& by_sender);

}  // namespace chat_digest
