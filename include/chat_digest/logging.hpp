#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace chat_digest {

// Process-wide logger named "chat_digest". Writes to stderr so stdout stays free for reports.
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

}  // namespace chat_digest
