#pragma once

#include <optional>
#include <string>
#include <utility>

namespace titan_core {

enum class DependencyErrorKind { Timeout, Transport, BadResponse, Cancelled, Unavailable };

inline std::string to_string(DependencyErrorKind kind) {
  switch (kind) {
    case DependencyErrorKind::Timeout:
      return "timeout";
    case DependencyErrorKind::Transport:
      return "transport";
    case DependencyErrorKind::BadResponse:
      return "bad_response";
    case DependencyErrorKind::Cancelled:
      return "cancelled";
    default:
      return "unavailable";
  }
}

// Transient failure of an embedding or LLM call. Always recoverable by the caller.
struct DependencyError {
  DependencyErrorKind kind = DependencyErrorKind::Unavailable;
  std::string message;

  std::string describe() const {
    return "(" + to_string(kind) + ") " + message;
  }
};

// Value-or-error returned across collaborator boundaries instead of throwing
template <typename T>
class CallResult {
 public:
  static CallResult success(T value) {
    CallResult result;
    result.value_ = std::move(value);
    return result;
  }

  static CallResult failure(DependencyErrorKind kind, std::string message) {
    CallResult result;
    result.error_ = DependencyError{kind, std::move(message)};
    return result;
  }

  bool ok() const {
    return value_.has_value();
  }

  const T &value() const {
    return *value_;
  }

  T &value() {
    return *value_;
  }

  const DependencyError &error() const {
    return error_;
  }

 private:
  CallResult() = default;

  std::optional<T> value_;
  DependencyError error_;
};

}  // namespace titan_core
