#pragma once

#include <atomic>

namespace dirimg {

class CancellationToken {
 public:
  CancellationToken() = default;
  // A child observes its parent's cancellation; cancelling the child leaves the parent untouched.
  explicit CancellationToken(const CancellationToken* parent) : parent_(parent) {}
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void Cancel() noexcept;
  [[nodiscard]] bool IsCancelled() const noexcept;
  void ThrowIfCancelled() const;

 private:
  const CancellationToken* parent_ = nullptr;
  std::atomic<bool> cancelled_{false};
};

}  // namespace dirimg
