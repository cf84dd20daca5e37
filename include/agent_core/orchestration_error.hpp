#pragma once

#include <exception>
#include <string>

namespace agent_core {

enum class OrchestrationErrorKind { NotFound, InvalidState, InvalidArgument };

inline std::string kind_to_string(OrchestrationErrorKind kind) {
  switch (kind) {
    case OrchestrationErrorKind::NotFound: return "not_found";
    case OrchestrationErrorKind::InvalidState: return "invalid_state";
    case OrchestrationErrorKind::InvalidArgument: return "invalid_argument";
  }
  return "generic";
}

// Raised by AgentOrchestrationService before any shared state is touched, so a caller
// that catches it can retry or report without having to re-read the task.
class OrchestrationError : public std::exception {
 public:
  OrchestrationError(OrchestrationErrorKind kind,
                     const std::string& operation,
                     const std::string& detail)
      : kind_(kind),
        message_(operation + " failed: (" + kind_to_string(kind) + ") " + detail) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

  OrchestrationErrorKind kind() const {
    return kind_;
  }

 private:
  OrchestrationErrorKind kind_;
  std::string message_;
};

}  // namespace agent_core
