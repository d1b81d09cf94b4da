#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "chat_digest/civil_time.hpp"

namespace chat_digest {

enum class MessageKind {
  Normal = 0,
  SystemEvent = 1,
  // "You deleted this message": the export owner removed their own message.
  DeletedByAuthor = 2,
  // "This message was deleted": another participant removed theirs.
  DeletedByOther = 3,
};

std::string_view kind_name(MessageKind kind);

struct Message {
  LocalDateTime timestamp;
  std::int64_t epoch_seconds = 0;
  std::string sender;  // empty for SystemEvent
  std::string body;
  MessageKind kind = MessageKind::Normal;

  bool is_system() const { return kind == MessageKind::SystemEvent; }
  bool is_deleted() const {
    return kind == MessageKind::DeletedByAuthor || kind == MessageKind::DeletedByOther;
  }
  // Counted in activity statistics (volume, buckets, conversations).
  bool is_activity() const { return !is_system(); }
};

}  // namespace chat_digest
