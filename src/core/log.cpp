#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace dirimg::core {
namespace {

bool IsTruthy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::mutex& OutputMutex() {
  static std::mutex mutex;
  return mutex;
}

}  // namespace

bool LoggingEnabled() {
  static const bool enabled = []() {
#if defined(NDEBUG)
    constexpr bool kDefault = false;
#else
    constexpr bool kDefault = true;
#endif
    const char* env = std::getenv("DIRIMG_LOG");
    if (env == nullptr) {
      return kDefault;
    }
    return IsTruthy(env);
  }();
  return enabled;
}

void Log(std::string_view message) {
  if (!LoggingEnabled()) {
    return;
  }
  std::lock_guard<std::mutex> lock(OutputMutex());
  std::clog << "[dirimg] " << message << "\n";
}

void LogError(std::string_view message) {
  if (!LoggingEnabled()) {
    return;
  }
  std::lock_guard<std::mutex> lock(OutputMutex());
  std::clog << "[dirimg] ERROR: " << message << "\n";
}

void LogTo(const LogFunction& sink, std::string_view message) {
  if (sink) {
    sink(message);
    return;
  }
  Log(message);
}

}  // namespace dirimg::core
