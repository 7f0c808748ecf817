#pragma once

#include <exception>
#include <string>

namespace titan_core {

// Fatal at startup: missing database, unreadable or misaligned indices, bad config values
class ConfigurationError : public std::exception {
 public:
  explicit ConfigurationError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class KnowledgeStoreError : public std::exception {
 public:
  explicit KnowledgeStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

}  // namespace titan_core
