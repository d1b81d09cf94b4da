#pragma once

#include <ostream>
#include <string>
#include <string_view>

#include "chat_digest/summary.hpp"

namespace chat_digest {

// Escapes quotes, backslashes and control characters. Valid UTF-8 passes through unchanged;
// malformed bytes become U+FFFD.
std::string escape_json_string(std::string_view value);

// Writes every Summary field with snake_case keys, one top-level field per line. Floats use
// four decimals and absent optionals are written as null.
void write_json(std::ostream& out, const Summary& summary);

std::string to_json(const Summary& summary);

}  // namespace chat_digest
