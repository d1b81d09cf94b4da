#include "chat_digest/time_buckets.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>

#include "chat_digest/civil_time.hpp"

namespace chat_digest {
namespace {

std::vector<Count> to_counts(const std::map<std::int64_t, std::uint64_t>& by_day) {
  std::vector<Count> out;
  out.reserve(by_day.size());
  for (const auto& [day, value] : by_day) {
    out.push_back(Count{format_iso_date(civil_from_days(day)), value});
  }
  return out;
}

}  // namespace

TimeBuckets bucket_messages(const std::vector<Message>& messages) {
  std::array<std::uint64_t, 24> hourly{};
  std::array<std::uint64_t, 7> weekly{};
  std::map<std::int64_t, std::uint64_t> daily;
  std::map<std::string, std::uint64_t> monthly;

  std::unordered_map<std::string, std::size_t> person_index;
  std::vector<PersonBuckets> people;
  std::map<std::string, std::map<std::int64_t, std::uint64_t>> person_daily;

  for (const Message& message : messages) {
    if (!message.is_activity()) {
      continue;
    }
    const CivilDate& date = message.timestamp.date;
    const std::int64_t day = days_from_civil(date);
    const int hour = message.timestamp.hour;
    const int weekday = weekday_index(date);

    ++hourly[static_cast<std::size_t>(hour)];
    ++weekly[static_cast<std::size_t>(weekday)];
    ++daily[day];
    ++monthly[format_year_month(date)];

    const auto [it, inserted] = person_index.try_emplace(message.sender, people.size());
    if (inserted) {
      PersonBuckets person;
      person.name = message.sender;
      people.push_back(std::move(person));
    }
    PersonBuckets& person = people[it->second];
    ++person.messages;
    ++person.hourly[static_cast<std::size_t>(hour)];
    ++person.daily[static_cast<std::size_t>(weekday)];
    ++person.monthly[static_cast<std::size_t>(date.month - 1)];

    ++person_daily[message.sender][day];
  }

  TimeBuckets buckets;
  buckets.daily = to_counts(daily);

  buckets.hourly.reserve(hourly.size());
  for (std::size_t hour = 0; hour < hourly.size(); ++hour) {
    buckets.hourly.push_back(HourCount{static_cast<std::uint32_t>(hour), hourly[hour]});
  }

  if (!daily.empty()) {
    const std::int64_t first = daily.begin()->first;
    const std::int64_t last = daily.rbegin()->first;
    buckets.timeline.reserve(static_cast<std::size_t>(last - first + 1));
    for (std::int64_t day = first; day <= last; ++day) {
      const auto found = daily.find(day);
      buckets.timeline.push_back(Count{format_iso_date(civil_from_days(day)),
                                       found == daily.end() ? 0 : found->second});
    }
  }

  buckets.weekly.reserve(weekly.size());
  for (std::size_t index = 0; index < weekly.size(); ++index) {
    buckets.weekly.push_back(
        Count{std::string(weekday_label(static_cast<int>(index))), weekly[index]});
  }

  buckets.monthly.reserve(monthly.size());
  for (const auto& [label, value] : monthly) {
    buckets.monthly.push_back(Count{label, value});
  }

  std::stable_sort(people.begin(), people.end(),
                   [](const PersonBuckets& lhs, const PersonBuckets& rhs) {
                     return lhs.messages > rhs.messages;
                   });
  buckets.by_person = std::move(people);

  buckets.per_person_daily.reserve(person_daily.size());
  for (const auto& [name, days] : person_daily) {
    buckets.per_person_daily.push_back(PersonDaily{name, to_counts(days)});
  }
  return buckets;
}

}  // namespace chat_digest
