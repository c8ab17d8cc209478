#include "dirimg/errors.hpp"

#include <system_error>

namespace dirimg {

bool IsTransientNetworkError(const std::exception& error) {
  const auto* system_error = dynamic_cast<const std::system_error*>(&error);
  if (system_error == nullptr) {
    return false;
  }
  const auto& code = system_error->code();
  return code == std::errc::connection_reset || code == std::errc::broken_pipe;
}

}  // namespace dirimg
