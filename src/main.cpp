#include <CLI/CLI.hpp>

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "chat_digest/analyzer.hpp"
#include "chat_digest/conversations.hpp"
#include "chat_digest/error.hpp"
#include "chat_digest/export_reader.hpp"
#include "chat_digest/logging.hpp"
#include "chat_digest/summary_json.hpp"

namespace {

constexpr int kAnalysisFailed = 2;

void print_counts(const char* title, const std::vector<chat_digest::Count>& counts) {
  std::cout << '\n' << title << ":\n";
  if (counts.empty()) {
    std::cout << "(none)\n";
    return;
  }
  std::cout << "Rank  Count  Label\n";
  for (std::size_t i = 0; i < counts.size(); ++i) {
    const auto& entry = counts[i];
    std::cout << (i + 1) << "     " << entry.value << "      " << entry.label << '\n';
  }
}

void print_table(const chat_digest::Summary& summary) {
  std::cout << "Total messages:   " << summary.total_messages << '\n';
  std::cout << "Participants:     " << summary.by_sender.size() << '\n';
  std::cout << "Active days:      " << summary.daily.size() << '\n';
  std::cout << "Conversations:    " << summary.conversation_count << '\n';
  std::cout << "Deleted:          you=" << summary.deleted_you
            << " others=" << summary.deleted_others << '\n';

  const auto& calendar = summary.calendar;
  if (calendar.busiest_day) {
    std::cout << "Busiest day:      " << calendar.busiest_day->label << " ("
              << calendar.busiest_day->value << ")\n";
  }
  if (calendar.quietest_day) {
    std::cout << "Quietest day:     " << calendar.quietest_day->label << " ("
              << calendar.quietest_day->value << ")\n";
  }
  std::cout << "Longest streak:   " << calendar.longest_streak.days << " day(s)";
  if (calendar.longest_streak.days > 0) {
    std::cout << ", " << calendar.longest_streak.start << " .. " << calendar.longest_streak.end;
  }
  std::cout << '\n';

  print_counts("Messages by sender", summary.by_sender);
  print_counts("Conversation starters", summary.conversation_starters);
  print_counts("Top words", summary.top_words);
  print_counts("Top emojis", summary.top_emojis);
  print_counts("Top phrases", summary.top_phrases);

  std::cout << "\nSentiment:\n";
  for (const auto& person : summary.sentiment_overall) {
    std::cout << person.name << ": mean=" << person.mean << " pos=" << person.pos
              << " neu=" << person.neu << " neg=" << person.neg << '\n';
  }

  if (summary.journey && !summary.journey->interesting_moments.empty()) {
    std::cout << "\nMoments:\n";
    for (const auto& moment : summary.journey->interesting_moments) {
      std::cout << moment.date << "  " << moment.title << '\n';
    }
  }
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App app{"chat-digest: summarize WhatsApp chat exports"};
  app.require_subcommand(1);

  std::vector<std::string> files;
  chat_digest::AnalyzeOptions options;
  bool print_json_output = false;
  bool verbose = false;

  CLI::App* analyze = app.add_subcommand("analyze", "Analyze one or more chat export files.");
  analyze->add_option("files", files, "Chat export files, joined in order.")
      ->required()
      ->check(CLI::ExistingFile);
  analyze->add_option("--top-words", options.top_words_n, "Number of top words to report.")
      ->default_val(10)
      ->check(CLI::NonNegativeNumber);
  analyze->add_option("--top-emojis", options.top_emojis_n, "Number of top emojis to report.")
      ->default_val(10)
      ->check(CLI::NonNegativeNumber);
  analyze->add_option("--gap-minutes", options.conversation_gap_minutes,
                      "Silence in minutes that starts a new conversation.")
      ->default_val(30)
      ->check(CLI::Range(std::int64_t{0}, chat_digest::kMaxConversationGapMinutes));
  analyze->add_flag("--json", print_json_output, "Print JSON output.");
  analyze->add_flag("--verbose", verbose, "Log parsing and timing details to stderr.");

  CLI11_PARSE(app, argc, argv);

  if (*analyze) {
    if (verbose) {
      chat_digest::set_log_level(spdlog::level::debug);
    }

    const std::string raw = chat_digest::read_exports(files);
    try {
      const chat_digest::ChatAnalyzer analyzer(options);
      const chat_digest::Summary summary = analyzer.analyze(raw);

      if (print_json_output) {
        chat_digest::write_json(std::cout, summary);
      } else {
        print_table(summary);
      }
    } catch (const chat_digest::AnalysisError& error) {
      chat_digest::logger()->error("{}: {}", chat_digest::error_kind_name(error.kind()),
                                   error.what());
      return kAnalysisFailed;
    }
  }

  return 0;
}
