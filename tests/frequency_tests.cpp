#include "chat_digest/frequency.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "test_support.hpp"

using chat_digest::CivilDate;
using chat_digest::Count;
using chat_digest::MessageKind;
using chat_digest_test::make_message;
using chat_digest_test::make_system;

namespace {

std::vector<std::string> labels_of(const std::vector<Count>& counts) {
  std::vector<std::string> labels;
  for (const Count& entry : counts) {
    labels.push_back(entry.label);
  }
  return labels;
}

}  // namespace

TEST_CASE("frequency counter ranks ties by first occurrence", "[frequency]") {
  chat_digest::FrequencyCounter counter;
  counter.add("b");
  counter.add("a");
  counter.add("c");
  counter.add("a");
  counter.add("b");

  REQUIRE(counter.size() == 3);
  REQUIRE(counter.count("a") == 2);
  REQUIRE(counter.count("missing") == 0);
  REQUIRE(labels_of(counter.ranked()) == std::vector<std::string>{"b", "a", "c"});
  REQUIRE(labels_of(counter.ranked(2)) == std::vector<std::string>{"b", "a"});
  REQUIRE(labels_of(counter.entries()) == std::vector<std::string>{"b", "a", "c"});

  counter.add("c", 5);
  REQUIRE(counter.ranked(1)[0].label == "c");
  REQUIRE(counter.ranked(1)[0].value == 6);
}

TEST_CASE("top words honour the stop-word switch and skip short tokens", "[frequency]") {
  const CivilDate day{2024, 1, 5};
  const std::vector<chat_digest::Message> messages{
      make_message("Alice", "The pizza is great", day, 9, 0),
      make_message("Bob", "the PIZZA", day, 9, 5),
  };
  const auto tokenized = chat_digest::tokenize_messages(messages);

  const auto unfiltered = chat_digest::top_words(tokenized, 10, false);
  REQUIRE(labels_of(unfiltered) == std::vector<std::string>{"the", "pizza", "great"});
  REQUIRE(unfiltered[0].value == 2);
  REQUIRE(unfiltered[1].value == 2);

  const auto filtered = chat_digest::top_words(tokenized, 10, true);
  REQUIRE(labels_of(filtered) == std::vector<std::string>{"pizza", "great"});

  REQUIRE(chat_digest::top_words(tokenized, 1, false).size() == 1);
  REQUIRE(chat_digest::top_words(tokenized, 0, false).empty());
}

TEST_CASE("word clouds keep short tokens", "[frequency]") {
  const std::vector<chat_digest::Message> messages{
      make_message("Alice", "The pizza is great", CivilDate{2024, 1, 5}, 9, 0),
      make_message("Bob", "the PIZZA", CivilDate{2024, 1, 5}, 9, 5),
  };
  const auto tokenized = chat_digest::tokenize_messages(messages);

  REQUIRE(labels_of(chat_digest::word_cloud(tokenized, 10, false)) ==
          std::vector<std::string>{"the", "pizza", "is", "great"});
  REQUIRE(labels_of(chat_digest::word_cloud(tokenized, 10, true)) ==
          std::vector<std::string>{"pizza", "great"});
}

TEST_CASE("emoji rankings count every occurrence", "[frequency]") {
  const std::string smile = "\xF0\x9F\x98\x80";
  const std::string heart = "\xE2\x9D\xA4\xEF\xB8\x8F";
  const std::vector<chat_digest::Message> messages{
      make_message("Alice", heart + " morning " + smile + smile, CivilDate{2024, 1, 5}, 9, 0),
      make_message("Bob", heart, CivilDate{2024, 1, 5}, 9, 5),
  };
  const auto tokenized = chat_digest::tokenize_messages(messages);

  const auto emojis = chat_digest::top_emojis(tokenized, 10);
  REQUIRE(labels_of(emojis) == std::vector<std::string>{heart, smile});
  REQUIRE(emojis[0].value == 2);
  REQUIRE(chat_digest::emoji_cloud(tokenized, 1).size() == 1);
  REQUIRE(chat_digest::top_emojis(tokenized, 0).empty());
}

TEST_CASE("messages per sender include deletions but not system events", "[frequency]") {
  const CivilDate day{2024, 1, 5};
  const std::vector<chat_digest::Message> messages{
      make_message("Bob", "hi", day, 9, 0),
      make_message("Alice", "hello", day, 9, 1),
      make_system("Bob added Carol", day, 9, 2),
      make_message("Alice", "You deleted this message", day, 9, 3, MessageKind::DeletedByAuthor),
  };

  const auto by_sender = chat_digest::count_by_sender(messages);
  REQUIRE(by_sender.size() == 2);
  REQUIRE(by_sender[0].label == "Alice");
  REQUIRE(by_sender[0].value == 2);
  REQUIRE(by_sender[1].label == "Bob");
  REQUIRE(by_sender[1].value == 1);
}
