#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace dirimg {

class CancelledError : public std::runtime_error {
 public:
  CancelledError() : std::runtime_error("operation cancelled") {}
  explicit CancelledError(const std::string& message) : std::runtime_error(message) {}
};

class IntegrityError : public std::runtime_error {
 public:
  explicit IntegrityError(const std::string& message) : std::runtime_error(message) {}
};

class ManifestError : public std::runtime_error {
 public:
  explicit ManifestError(const std::string& message) : std::runtime_error(message) {}
};

// Connection reset and broken pipe are worth another attempt; everything else is permanent.
[[nodiscard]] bool IsTransientNetworkError(const std::exception& error);

}  // namespace dirimg
