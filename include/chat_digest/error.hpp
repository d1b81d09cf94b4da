#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace chat_digest {

enum class ErrorKind {
  EmptyInput = 0,
  UnrecognizedFormat = 1,
  InternalInvariantViolation = 2,
};

std::string_view error_kind_name(ErrorKind kind);

// The single error type surfaced by analysis. what() carries a human-readable message.
class AnalysisError : public std::runtime_error {
 public:
  AnalysisError(ErrorKind kind, const std::string& message);

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

}  // namespace chat_digest
