#include "error_group.hpp"

#include <utility>

namespace dirimg::core {

ErrorGroup::ErrorGroup(const CancellationToken* parent) : token_(parent) {}

ErrorGroup::~ErrorGroup() {
  token_.Cancel();
  JoinAll();
}

void ErrorGroup::Go(std::function<void()> task) {
  threads_.emplace_back([this, task = std::move(task)]() {
    try {
      task();
    } catch (...) {
      Fail(std::current_exception());
    }
  });
}

void ErrorGroup::Fail(std::exception_ptr error) {
  {
    std::lock_guard<std::mutex> lock(error_mutex_);
    if (first_error_ == nullptr) {
      first_error_ = std::move(error);
    }
  }
  token_.Cancel();
}

void ErrorGroup::Wait() {
  JoinAll();
  std::exception_ptr error;
  {
    std::lock_guard<std::mutex> lock(error_mutex_);
    error = first_error_;
  }
  if (error != nullptr) {
    std::rethrow_exception(error);
  }
}

bool ErrorGroup::failed() const {
  std::lock_guard<std::mutex> lock(error_mutex_);
  return first_error_ != nullptr;
}

void ErrorGroup::JoinAll() {
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
}

}  // namespace dirimg::core
