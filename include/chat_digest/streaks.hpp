#pragma once

#include <optional>
#include <vector>

#include "chat_digest/summary.hpp"

namespace chat_digest {

// Longest run of consecutive calendar days with a non-zero count. Labels are "YYYY-MM-DD"
// and are compared as day numbers, so daylight saving transitions cannot split a run.
// Unparsable labels break a run. Empty input yields {0, "", ""}.
StreakResult longest_streak(const std::vector<Count>& daily);

// Highest count, earliest day on ties.
std::optional<Count> busiest_day(const std::vector<Count>& daily);

// Lowest non-zero count, earliest day on ties.
std::optional<Count> quietest_day(const std::vector<Count>& daily);

CalendarHighlights calendar_highlights(const std::vector<Count>& daily);

}  // namespace chat_digest
