#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "chat_digest/line_reassembler.hpp"
#include "chat_digest/message.hpp"

namespace chat_digest {

// Trims whitespace, byte-order and directional marks and drops control / bidi characters.
std::string clean_sender(std::string_view raw);

// Deleted-message and system-notice detection for a header with a sender.
MessageKind classify_body(std::string_view sender, std::string_view body);

// Converts one reassembled unit into a Message: sender/body split and kind tagging.
Message to_message(const LogicalMessage& logical);

// Full parse of an export. Throws AnalysisError with EmptyInput for blank text and
// UnrecognizedFormat when no line carries a supported timestamp. The result is sorted by
// timestamp; equal timestamps keep input order.
std::vector<Message> parse_messages(std::string_view raw);

}  // namespace chat_digest
