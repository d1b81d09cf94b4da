#include "chat_digest/export_reader.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "chat_digest/logging.hpp"

namespace chat_digest {

std::string read_exports(const std::vector<std::string>& files) {
  if (files.empty()) {
    throw std::invalid_argument("no input files supplied");
  }

  std::string joined;
  for (const std::string& path : files) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
      throw std::runtime_error("failed to open file: " + path);
    }

    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
      throw std::runtime_error("failed to read file: " + path);
    }

    if (!joined.empty()) {
      joined.push_back('\n');
    }
    const std::string text = contents.str();
    logger()->debug("read {} bytes from {}", text.size(), path);
    joined += text;
  }
  return joined;
}

}  // namespace chat_digest
