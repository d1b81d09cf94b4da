#pragma once

#include <string>
#include <vector>

namespace chat_digest {

// Reads every export file and joins their contents with '\n', in argument order.
// Throws std::invalid_argument for an empty list and std::runtime_error when a file cannot
// be opened.
std::string read_exports(const std::vector<std::string>& files);

}  // namespace chat_digest
