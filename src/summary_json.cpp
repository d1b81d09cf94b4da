#include "chat_digest/summary_json.hpp"

#include <cstddef>
#include <cstdio>
#include <iomanip>
#include <sstream>

#include "chat_digest/utf8.hpp"

namespace chat_digest {
namespace {

void write_string(std::ostream& out, std::string_view value) {
  out << '"' << escape_json_string(value) << '"';
}

void write_double(std::ostream& out, double value) {
  std::ostringstream formatted;
  formatted << std::fixed << std::setprecision(4) << value;
  out << formatted.str();
}

template <typename Container, typename WriteItem>
void write_array(std::ostream& out, const Container& items, WriteItem write_item) {
  out << '[';
  bool first = true;
  for (const auto& item : items) {
    if (!first) {
      out << ", ";
    }
    first = false;
    write_item(out, item);
  }
  out << ']';
}

void write_count(std::ostream& out, const Count& count) {
  out << "{\"label\": ";
  write_string(out, count.label);
  out << ", \"value\": " << count.value << '}';
}

void write_counts(std::ostream& out, const std::vector<Count>& counts) {
  write_array(out, counts, write_count);
}

void write_numbers(std::ostream& out, const std::uint64_t* first, std::size_t size) {
  out << '[';
  for (std::size_t i = 0; i < size; ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << first[i];
  }
  out << ']';
}

void write_hour(std::ostream& out, const HourCount& hour) {
  out << "{\"hour\": " << hour.hour << ", \"value\": " << hour.value << '}';
}

void write_person_buckets(std::ostream& out, const PersonBuckets& person) {
  out << "{\"name\": ";
  write_string(out, person.name);
  out << ", \"messages\": " << person.messages << ", \"hourly\": ";
  write_numbers(out, person.hourly.data(), person.hourly.size());
  out << ", \"daily\": ";
  write_numbers(out, person.daily.data(), person.daily.size());
  out << ", \"monthly\": ";
  write_numbers(out, person.monthly.data(), person.monthly.size());
  out << '}';
}

void write_person_phrases(std::ostream& out, const PersonPhrases& person) {
  out << "{\"name\": ";
  write_string(out, person.name);
  out << ", \"phrases\": ";
  write_counts(out, person.phrases);
  out << '}';
}

void write_fun_fact(std::ostream& out, const FunFact& fact) {
  out << "{\"name\": ";
  write_string(out, fact.name);
  out << ", \"total_words\": " << fact.total_words
      << ", \"longest_message_words\": " << fact.longest_message_words
      << ", \"unique_words\": " << fact.unique_words
      << ", \"average_message_length\": " << fact.average_message_length
      << ", \"top_emojis\": ";
  write_array(out, fact.top_emojis,
              [](std::ostream& os, const std::string& emoji) { write_string(os, emoji); });
  out << '}';
}

void write_person_stat(std::ostream& out, const PersonStat& stat) {
  out << "{\"name\": ";
  write_string(out, stat.name);
  out << ", \"total_words\": " << stat.total_words << ", \"unique_words\": " << stat.unique_words
      << ", \"longest_message_words\": " << stat.longest_message_words
      << ", \"average_words_per_message\": ";
  write_double(out, stat.average_words_per_message);
  out << ", \"top_emojis\": ";
  write_counts(out, stat.top_emojis);
  out << ", \"dominant_color\": ";
  if (stat.dominant_color) {
    write_string(out, *stat.dominant_color);
  } else {
    out << "null";
  }
  out << '}';
}

void write_person_daily(std::ostream& out, const PersonDaily& person) {
  out << "{\"name\": ";
  write_string(out, person.name);
  out << ", \"daily\": ";
  write_counts(out, person.daily);
  out << '}';
}

template <typename Bucket>
void write_sentiment_counts(std::ostream& out, const Bucket& bucket) {
  out << ", \"mean\": ";
  write_double(out, bucket.mean);
  out << ", \"pos\": " << bucket.pos << ", \"neu\": " << bucket.neu << ", \"neg\": " << bucket.neg
      << '}';
}

void write_sentiment_day(std::ostream& out, const SentimentDay& day) {
  out << "{\"name\": ";
  write_string(out, day.name);
  out << ", \"day\": ";
  write_string(out, day.day);
  write_sentiment_counts(out, day);
}

void write_sentiment_overall(std::ostream& out, const SentimentOverall& person) {
  out << "{\"name\": ";
  write_string(out, person.name);
  write_sentiment_counts(out, person);
}

void write_journey_message(std::ostream& out, const JourneyMessage& message) {
  out << "{\"sender\": ";
  write_string(out, message.sender);
  out << ", \"text\": ";
  write_string(out, message.text);
  out << ", \"timestamp\": ";
  write_string(out, message.timestamp);
  out << ", \"is_you\": " << (message.is_you ? "true" : "false") << '}';
}

void write_journey_moment(std::ostream& out, const JourneyMoment& moment) {
  out << "{\"title\": ";
  write_string(out, moment.title);
  out << ", \"description\": ";
  write_string(out, moment.description);
  out << ", \"date\": ";
  write_string(out, moment.date);
  out << ", \"messages\": ";
  write_array(out, moment.messages, write_journey_message);
  out << ", \"sentiment_score\": ";
  write_double(out, moment.sentiment_score);
  out << '}';
}

void write_journey(std::ostream& out, const std::optional<Journey>& journey) {
  if (!journey) {
    out << "null";
    return;
  }
  out << "{\"first_day\": ";
  write_string(out, journey->first_day);
  out << ", \"last_day\": ";
  write_string(out, journey->last_day);
  out << ", \"total_days\": " << journey->total_days
      << ", \"total_messages\": " << journey->total_messages << ", \"first_messages\": ";
  write_array(out, journey->first_messages, write_journey_message);
  out << ", \"last_messages\": ";
  write_array(out, journey->last_messages, write_journey_message);
  out << ", \"interesting_moments\": ";
  write_array(out, journey->interesting_moments, write_journey_moment);
  out << '}';
}

void write_optional_count(std::ostream& out, const std::optional<Count>& count) {
  if (count) {
    write_count(out, *count);
  } else {
    out << "null";
  }
}

void write_calendar(std::ostream& out, const CalendarHighlights& calendar) {
  out << "{\"busiest_day\": ";
  write_optional_count(out, calendar.busiest_day);
  out << ", \"quietest_day\": ";
  write_optional_count(out, calendar.quietest_day);
  out << ", \"longest_streak\": {\"days\": " << calendar.longest_streak.days << ", \"start\": ";
  write_string(out, calendar.longest_streak.start);
  out << ", \"end\": ";
  write_string(out, calendar.longest_streak.end);
  out << "}}";
}

}  // namespace

std::string escape_json_string(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (const char32_t cp : utf8::decode(value)) {
    if (cp >= 0x80) {
      utf8::append(out, cp);
      continue;
    }
    const auto ch = static_cast<unsigned char>(cp);
    switch (ch) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (ch < 0x20) {
          char escaped[7];
          std::snprintf(escaped, sizeof(escaped), "\\u%04x", static_cast<unsigned int>(ch));
          out += escaped;
        } else {
          out.push_back(static_cast<char>(ch));
        }
    }
  }
  return out;
}

void write_json(std::ostream& out, const Summary& summary) {
  out << "{\n";
  out << "  \"total_messages\": " << summary.total_messages << ",\n";
  out << "  \"by_sender\": ";
  write_counts(out, summary.by_sender);
  out << ",\n  \"daily\": ";
  write_counts(out, summary.daily);
  out << ",\n  \"hourly\": ";
  write_array(out, summary.hourly, write_hour);
  out << ",\n  \"top_emojis\": ";
  write_counts(out, summary.top_emojis);
  out << ",\n  \"top_words\": ";
  write_counts(out, summary.top_words);
  out << ",\n  \"top_words_no_stop\": ";
  write_counts(out, summary.top_words_no_stop);
  out << ",\n  \"deleted_you\": " << summary.deleted_you;
  out << ",\n  \"deleted_others\": " << summary.deleted_others;
  out << ",\n  \"timeline\": ";
  write_counts(out, summary.timeline);
  out << ",\n  \"weekly\": ";
  write_counts(out, summary.weekly);
  out << ",\n  \"monthly\": ";
  write_counts(out, summary.monthly);
  out << ",\n  \"share_of_speech\": ";
  write_counts(out, summary.share_of_speech);
  out << ",\n  \"buckets_by_person\": ";
  write_array(out, summary.buckets_by_person, write_person_buckets);
  out << ",\n  \"word_cloud\": ";
  write_counts(out, summary.word_cloud);
  out << ",\n  \"word_cloud_no_stop\": ";
  write_counts(out, summary.word_cloud_no_stop);
  out << ",\n  \"emoji_cloud\": ";
  write_counts(out, summary.emoji_cloud);
  out << ",\n  \"salient_phrases\": ";
  write_counts(out, summary.salient_phrases);
  out << ",\n  \"top_phrases\": ";
  write_counts(out, summary.top_phrases);
  out << ",\n  \"top_phrases_no_stop\": ";
  write_counts(out, summary.top_phrases_no_stop);
  out << ",\n  \"per_person_phrases\": ";
  write_array(out, summary.per_person_phrases, write_person_phrases);
  out << ",\n  \"per_person_phrases_no_stop\": ";
  write_array(out, summary.per_person_phrases_no_stop, write_person_phrases);
  out << ",\n  \"fun_facts\": ";
  write_array(out, summary.fun_facts, write_fun_fact);
  out << ",\n  \"person_stats\": ";
  write_array(out, summary.person_stats, write_person_stat);
  out << ",\n  \"per_person_daily\": ";
  write_array(out, summary.per_person_daily, write_person_daily);
  out << ",\n  \"sentiment_by_day\": ";
  write_array(out, summary.sentiment_by_day, write_sentiment_day);
  out << ",\n  \"sentiment_overall\": ";
  write_array(out, summary.sentiment_overall, write_sentiment_overall);
  out << ",\n  \"conversation_starters\": ";
  write_counts(out, summary.conversation_starters);
  out << ",\n  \"conversation_count\": " << summary.conversation_count;
  out << ",\n  \"journey\": ";
  write_journey(out, summary.journey);
  out << ",\n  \"calendar\": ";
  write_calendar(out, summary.calendar);
  out << "\n}\n";
}

std::string to_json(const Summary& summary) {
  std::ostringstream out;
  write_json(out, summary);
  return out.str();
}

}  // namespace chat_digest
