#include "chat_digest/error.hpp"

namespace chat_digest {

std::string_view error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::EmptyInput:
      return "empty_input";
    case ErrorKind::UnrecognizedFormat:
      return "unrecognized_format";
    case ErrorKind::InternalInvariantViolation:
      return "internal_invariant_violation";
  }
  return "unknown";
}

AnalysisError::AnalysisError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

}  // namespace chat_digest
