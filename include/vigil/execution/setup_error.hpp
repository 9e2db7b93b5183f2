#pragma once

#include <vigil/schema/queue_error_code.hpp>
#include <stdexcept>
#include <string>

namespace vigil::execution {

/// Raised when a fresh queue cannot be created from its configuration.
class setup_error final : public std::runtime_error {
 public:
  setup_error(vigil::schema::queue_error_code code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  vigil::schema::queue_error_code code() const noexcept { return code_; }

 private:
  vigil::schema::queue_error_code code_;
};

}  // namespace vigil::execution
