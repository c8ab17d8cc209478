#pragma once

#include "dirimg/types.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace dirimg {

// Single-slot channel. Senders never block: an update arriving while the slot is
// occupied is dropped.
class ProgressChannel {
 public:
  bool TrySend(const ProgressUpdate& update);
  [[nodiscard]] std::optional<ProgressUpdate> TryReceive();
  [[nodiscard]] std::optional<ProgressUpdate> Receive(std::chrono::milliseconds timeout);
  [[nodiscard]] std::uint64_t dropped_count() const;

 private:
  mutable std::mutex mutex_{};
  std::condition_variable ready_{};
  std::optional<ProgressUpdate> slot_{};
  std::uint64_t dropped_count_ = 0;
};

}  // namespace dirimg
