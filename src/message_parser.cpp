#include "chat_digest/message_parser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

#include "chat_digest/error.hpp"
#include "chat_digest/logging.hpp"
#include "chat_digest/utf8.hpp"

namespace chat_digest {
namespace {

constexpr std::string_view kLrm = "\xE2\x80\x8E";

constexpr std::array<std::string_view, 6> kDeletedByAuthor{
    "you deleted this message",
    "du hast diese nachricht gel\xC3\xB6scht",
    "eliminaste este mensaje",
    "vous avez supprim\xC3\xA9 ce message",
    "hai eliminato questo messaggio",
    "voc\xC3\xAA apagou esta mensagem",
};

constexpr std::array<std::string_view, 6> kDeletedByOther{
    "this message was deleted",
    "diese nachricht wurde gel\xC3\xB6scht",
    "se elimin\xC3\xB3 este mensaje",
    "ce message a \xC3\xA9t\xC3\xA9 supprim\xC3\xA9",
    "questo messaggio \xC3\xA8 stato eliminato",
    "mensagem apagada",
};

constexpr std::array<std::string_view, 11> kSystemNotices{
    "messages and calls are end-to-end encrypted",
    "created group",
    "created this group",
    "changed this group's icon",
    "changed the group description",
    "changed the subject",
    "changed the group name",
    "joined using this group's invite link",
    "missed voice call",
    "missed video call",
    "changed their phone number",
};

// Membership changes; WhatsApp marks these bodies with a leading LRM.
constexpr std::array<std::string_view, 6> kMembershipNotices{
    " added ", " removed ", " left", " joined", "you were added", "you were removed",
};

bool is_blank(std::string_view text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char ch) { return std::isspace(ch) != 0; });
}

std::string_view trim_ascii(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

bool strip_lrm(std::string_view& text) {
  bool stripped = false;
  while (text.substr(0, kLrm.size()) == kLrm) {
    text.remove_prefix(kLrm.size());
    stripped = true;
  }
  return stripped;
}

bool contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

bool is_system_notice(std::string_view lowered) {
  for (const std::string_view notice : kSystemNotices) {
    if (contains(lowered, notice)) {
      return true;
    }
  }
  return contains(lowered, "security code") &&
         (contains(lowered, "tap to learn more") || contains(lowered, "changed"));
}

// A notice whose quoted subject holds ": " splits inside the notice itself.
bool sender_part_is_notice(std::string_view sender_part) {
  strip_lrm(sender_part);
  return is_system_notice(utf8::to_lower(trim_ascii(sender_part)));
}

bool is_sender_mark(char32_t cp) {
  return utf8::is_space(cp) || cp == 0xFEFF || cp == 0x200E || cp == 0x200F;
}

bool is_dropped_from_sender(char32_t cp) {
  if (cp < 0x20 || (cp >= 0x7F && cp <= 0x9F)) {
    return true;
  }
  return (cp >= 0x202A && cp <= 0x202F) || cp == 0x2060 || (cp >= 0x2066 && cp <= 0x2069);
}

}  // namespace

std::string_view kind_name(MessageKind kind) {
  switch (kind) {
    case MessageKind::Normal:
      return "normal";
    case MessageKind::SystemEvent:
      return "system";
    case MessageKind::DeletedByAuthor:
      return "deleted_by_author";
    case MessageKind::DeletedByOther:
      return "deleted_by_other";
  }
  return "unknown";
}

std::string clean_sender(std::string_view raw) {
  const std::vector<char32_t> codepoints = utf8::decode(raw);

  std::size_t start = 0;
  std::size_t end = codepoints.size();
  while (start < end && is_sender_mark(codepoints[start])) {
    ++start;
  }
  while (end > start && is_sender_mark(codepoints[end - 1])) {
    --end;
  }

  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = start; i < end; ++i) {
    if (!is_dropped_from_sender(codepoints[i])) {
      utf8::append(out, codepoints[i]);
    }
  }
  return out;
}

MessageKind classify_body(std::string_view sender, std::string_view body) {
  if (utf8::to_lower(trim_ascii(sender)) == "system") {
    return MessageKind::SystemEvent;
  }

  std::string_view view = trim_ascii(body);
  const bool marked = strip_lrm(view);
  view = trim_ascii(view);
  while (!view.empty() && view.back() == '.') {
    view.remove_suffix(1);
  }
  const std::string text = utf8::to_lower(view);

  for (const std::string_view variant : kDeletedByAuthor) {
    if (text == variant) {
      return MessageKind::DeletedByAuthor;
    }
  }
  for (const std::string_view variant : kDeletedByOther) {
    if (text == variant) {
      return MessageKind::DeletedByOther;
    }
  }

  if (is_system_notice(text)) {
    return MessageKind::SystemEvent;
  }

  if (marked) {
    for (const std::string_view notice : kMembershipNotices) {
      if (contains(text, notice)) {
        return MessageKind::SystemEvent;
      }
    }
  }

  return MessageKind::Normal;
}

Message to_message(const LogicalMessage& logical) {
  Message message;
  message.timestamp = logical.timestamp;
  message.epoch_seconds = to_epoch_seconds(logical.timestamp);

  const std::string_view head = logical.head;
  const std::size_t colon = head.find(':');
  const bool has_sender =
      colon != std::string_view::npos && colon > 0 &&
      (colon + 1 == head.size() || std::isspace(static_cast<unsigned char>(head[colon + 1])) != 0);

  if (!has_sender || sender_part_is_notice(head.substr(0, colon))) {
    message.kind = MessageKind::SystemEvent;
    message.body.assign(head.data(), head.size());
    message.body += logical.tail;
    return message;
  }

  std::string_view body = head.substr(colon + 1);
  if (!body.empty()) {
    body.remove_prefix(1);
  }
  message.sender = clean_sender(head.substr(0, colon));
  message.body.assign(body.data(), body.size());
  message.body += logical.tail;
  message.kind = message.sender.empty() ? MessageKind::SystemEvent
                                        : classify_body(message.sender, message.body);
  if (message.kind == MessageKind::SystemEvent) {
    message.sender.clear();
  }
  return message;
}

std::vector<Message> parse_messages(std::string_view raw) {
  if (is_blank(raw)) {
    throw AnalysisError(ErrorKind::EmptyInput, "chat export is empty");
  }

  const ReassembledText reassembled = reassemble_lines(raw);
  if (reassembled.messages.empty()) {
    throw AnalysisError(ErrorKind::UnrecognizedFormat,
                        "no line starts with a supported chat timestamp");
  }

  logger()->debug("date order vote over {} header(s): day-first={} month-first={} -> {}",
                  reassembled.header_candidates, reassembled.vote.day_first,
                  reassembled.vote.month_first,
                  date_order_name(reassembled.vote.chosen));
  if (reassembled.malformed_headers > 0) {
    logger()->warn("{} timestamped line(s) had an impossible {} date; kept as message text",
                   reassembled.malformed_headers, date_order_name(reassembled.vote.chosen));
  }
  if (reassembled.dropped_lines > 0) {
    logger()->debug("dropped {} line(s) before the first timestamped message",
                    reassembled.dropped_lines);
  }

  std::vector<Message> messages;
  messages.reserve(reassembled.messages.size());
  for (const LogicalMessage& logical : reassembled.messages) {
    messages.push_back(to_message(logical));
  }

  std::stable_sort(messages.begin(), messages.end(), [](const Message& lhs, const Message& rhs) {
    return lhs.epoch_seconds < rhs.epoch_seconds;
  });

  return messages;
}

}  // namespace chat_digest
