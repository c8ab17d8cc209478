#include "dirimg/cancellation.hpp"

#include "dirimg/errors.hpp"

namespace dirimg {

void CancellationToken::Cancel() noexcept {
  cancelled_.store(true, std::memory_order_release);
}

bool CancellationToken::IsCancelled() const noexcept {
  if (cancelled_.load(std::memory_order_acquire)) {
    return true;
  }
  return parent_ != nullptr && parent_->IsCancelled();
}

void CancellationToken::ThrowIfCancelled() const {
  if (IsCancelled()) {
    throw CancelledError();
  }
}

}  // namespace dirimg
