#include "chat_digest/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace chat_digest {

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> instance = [] {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto created = std::make_shared<spdlog::logger>("chat_digest", sink);
    created->set_level(spdlog::level::warn);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    return created;
  }();
  return instance;
}

void set_log_level(spdlog::level::level_enum level) {
  logger()->set_level(level);
}

}  // namespace chat_digest
