#include "dirimg/progress.hpp"

namespace dirimg {

bool ProgressChannel::TrySend(const ProgressUpdate& update) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (slot_.has_value()) {
      ++dropped_count_;
      return false;
    }
    slot_ = update;
  }
  ready_.notify_one();
  return true;
}

std::optional<ProgressUpdate> ProgressChannel::TryReceive() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto out = slot_;
  slot_.reset();
  return out;
}

std::optional<ProgressUpdate> ProgressChannel::Receive(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!ready_.wait_for(lock, timeout, [this] { return slot_.has_value(); })) {
    return std::nullopt;
  }
  auto out = slot_;
  slot_.reset();
  return out;
}

std::uint64_t ProgressChannel::dropped_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_count_;
}

}  // namespace dirimg
