#include "chat_digest/streaks.hpp"

#include <algorithm>
#include <cstdint>

#include "chat_digest/civil_time.hpp"

namespace chat_digest {
namespace {

std::vector<const Count*> active_days_by_label(const std::vector<Count>& daily) {
  std::vector<const Count*> days;
  days.reserve(daily.size());
  for (const Count& day : daily) {
    if (day.value > 0) {
      days.push_back(&day);
    }
  }
  std::stable_sort(days.begin(), days.end(),
                   [](const Count* lhs, const Count* rhs) { return lhs->label < rhs->label; });
  return days;
}

}  // namespace

StreakResult longest_streak(const std::vector<Count>& daily) {
  const std::vector<const Count*> days = active_days_by_label(daily);
  if (days.empty()) {
    return {};
  }

  std::size_t best_start = 0;
  std::size_t best_end = 0;
  std::size_t current_start = 0;
  std::optional<std::int64_t> previous = std::nullopt;
  for (std::size_t i = 0; i < days.size(); ++i) {
    const std::optional<CivilDate> date = parse_iso_date(days[i]->label);
    const std::optional<std::int64_t> current =
        date ? std::optional<std::int64_t>(days_from_civil(*date)) : std::nullopt;

    if (i > 0 && !(previous && current && *current - *previous == 1)) {
      current_start = i;
    }
    if (i - current_start > best_end - best_start) {
      best_start = current_start;
      best_end = i;
    }
    previous = current;
  }

  StreakResult result;
  result.days = best_end - best_start + 1;
  result.start = days[best_start]->label;
  result.end = days[best_end]->label;
  return result;
}

std::optional<Count> busiest_day(const std::vector<Count>& daily) {
  const Count* best = nullptr;
  for (const Count& day : daily) {
    if (best == nullptr || day.value > best->value ||
        (day.value == best->value && day.label < best->label)) {
      best = &day;
    }
  }
  if (best == nullptr || best->value == 0) {
    return std::nullopt;
  }
  return *best;
}

std::optional<Count> quietest_day(const std::vector<Count>& daily) {
  const Count* best = nullptr;
  for (const Count& day : daily) {
    if (day.value == 0) {
      continue;
    }
    if (best == nullptr || day.value < best->value ||
        (day.value == best->value && day.label < best->label)) {
      best = &day;
    }
  }
  if (best == nullptr) {
    return std::nullopt;
  }
  return *best;
}

CalendarHighlights calendar_highlights(const std::vector<Count>& daily) {
  CalendarHighlights highlights;
  highlights.busiest_day = busiest_day(daily);
  highlights.quietest_day = quietest_day(daily);
  highlights.longest_streak = longest_streak(daily);
  return highlights;
}

}  // namespace chat_digest
