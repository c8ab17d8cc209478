#pragma once

#include "dirimg/types.hpp"

#include <string_view>

namespace dirimg::core {

// Library log lines go to std::clog, gated by DIRIMG_LOG (on by default in debug builds).
[[nodiscard]] bool LoggingEnabled();
void Log(std::string_view message);
void LogError(std::string_view message);

// Routes through `sink` when one is set, otherwise through Log.
void LogTo(const LogFunction& sink, std::string_view message);

}  // namespace dirimg::core
