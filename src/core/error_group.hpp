#pragma once

#include "dirimg/cancellation.hpp"

#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace dirimg::core {

// Runs tasks on their own threads. The first task to throw (or to call Fail)
// cancels the group's token; Wait joins everything and rethrows that first error.
class ErrorGroup {
 public:
  explicit ErrorGroup(const CancellationToken* parent = nullptr);
  ErrorGroup(const ErrorGroup&) = delete;
  ErrorGroup& operator=(const ErrorGroup&) = delete;
  ~ErrorGroup();

  void Go(std::function<void()> task);
  void Fail(std::exception_ptr error);
  void Wait();

  [[nodiscard]] const CancellationToken& token() const { return token_; }
  [[nodiscard]] bool failed() const;

 private:
  void JoinAll();

  CancellationToken token_;
  std::vector<std::thread> threads_{};
  mutable std::mutex error_mutex_{};
  std::exception_ptr first_error_{};
};

}  // namespace dirimg::core
