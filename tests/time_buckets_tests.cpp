#include "chat_digest/time_buckets.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <vector>

#include "test_support.hpp"

using chat_digest::CivilDate;
using chat_digest::MessageKind;
using chat_digest_test::make_message;
using chat_digest_test::make_system;

namespace {

std::vector<chat_digest::Message> sample_messages() {
  return {
      make_message("Alice", "morning", CivilDate{2024, 1, 6}, 9, 0),
      make_message("Bob", "evening", CivilDate{2024, 1, 6}, 21, 30),
      make_system("Alice added Carol", CivilDate{2024, 1, 7}, 10, 0),
      make_message("Alice", "You deleted this message", CivilDate{2024, 1, 8}, 9, 15,
                   MessageKind::DeletedByAuthor),
      make_message("Alice", "early", CivilDate{2024, 2, 1}, 0, 5),
      make_message("Bob", "late", CivilDate{2024, 2, 1}, 23, 59),
  };
}

}  // namespace

TEST_CASE("daily and hourly buckets skip system events", "[buckets]") {
  const auto buckets = chat_digest::bucket_messages(sample_messages());

  REQUIRE(buckets.daily.size() == 3);
  REQUIRE(buckets.daily[0].label == "2024-01-06");
  REQUIRE(buckets.daily[0].value == 2);
  REQUIRE(buckets.daily[1].label == "2024-01-08");
  REQUIRE(buckets.daily[2].label == "2024-02-01");

  REQUIRE(buckets.hourly.size() == 24);
  REQUIRE(buckets.hourly[0].value == 1);
  REQUIRE(buckets.hourly[9].value == 2);
  REQUIRE(buckets.hourly[10].value == 0);
  REQUIRE(buckets.hourly[23].hour == 23);
  REQUIRE(buckets.hourly[23].value == 1);
}

TEST_CASE("the timeline fills silent days with zero", "[buckets]") {
  const auto buckets = chat_digest::bucket_messages(sample_messages());

  REQUIRE(buckets.timeline.size() == 27);
  REQUIRE(buckets.timeline.front().label == "2024-01-06");
  REQUIRE(buckets.timeline[1].label == "2024-01-07");
  REQUIRE(buckets.timeline[1].value == 0);
  REQUIRE(buckets.timeline.back().label == "2024-02-01");

  std::uint64_t total = 0;
  for (const auto& day : buckets.timeline) {
    total += day.value;
  }
  REQUIRE(total == 5);
}

TEST_CASE("weekly and monthly buckets use calendar labels", "[buckets]") {
  const auto buckets = chat_digest::bucket_messages(sample_messages());

  REQUIRE(buckets.weekly.size() == 7);
  REQUIRE(buckets.weekly[0].label == "Sun");
  REQUIRE(buckets.weekly[0].value == 0);
  REQUIRE(buckets.weekly[1].value == 1);
  REQUIRE(buckets.weekly[4].value == 2);
  REQUIRE(buckets.weekly[6].label == "Sat");
  REQUIRE(buckets.weekly[6].value == 2);

  REQUIRE(buckets.monthly.size() == 2);
  REQUIRE(buckets.monthly[0].label == "2024-01");
  REQUIRE(buckets.monthly[0].value == 3);
  REQUIRE(buckets.monthly[1].label == "2024-02");
  REQUIRE(buckets.monthly[1].value == 2);
}

TEST_CASE("per-person buckets add up to each sender's activity", "[buckets]") {
  const auto buckets = chat_digest::bucket_messages(sample_messages());

  REQUIRE(buckets.by_person.size() == 2);
  const auto& alice = buckets.by_person[0];
  REQUIRE(alice.name == "Alice");
  REQUIRE(alice.messages == 3);
  REQUIRE(alice.hourly[9] == 2);
  REQUIRE(alice.daily[6] == 1);
  REQUIRE(alice.monthly[0] == 2);
  REQUIRE(alice.monthly[1] == 1);
  REQUIRE(buckets.by_person[1].name == "Bob");

  REQUIRE(buckets.per_person_daily.size() == 2);
  REQUIRE(buckets.per_person_daily[0].name == "Alice");
  REQUIRE(buckets.per_person_daily[0].daily.size() == 3);
  REQUIRE(buckets.per_person_daily[1].name == "Bob");
  REQUIRE(buckets.per_person_daily[1].daily.size() == 2);
  REQUIRE(buckets.per_person_daily[1].daily[1].label == "2024-02-01");
}

TEST_CASE("no activity gives empty buckets and a full hourly table", "[buckets]") {
  const auto buckets = chat_digest::bucket_messages({});
  REQUIRE(buckets.daily.empty());
  REQUIRE(buckets.timeline.empty());
  REQUIRE(buckets.hourly.size() == 24);
  REQUIRE(buckets.weekly.size() == 7);
  REQUIRE(buckets.by_person.empty());
}
