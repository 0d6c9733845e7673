#ifndef GRIDSTORE_STORE_ERROR_HPP
#define GRIDSTORE_STORE_ERROR_HPP

#include <stdexcept>
#include <string>
#include <system_error>

namespace gridstore {
namespace store {

// Failure reported by the underlying document store (network, serialization, command)
class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message)
    : std::runtime_error(message) {}

  StoreError(const std::string& message, std::error_code code)
    : std::runtime_error(message), code_(code) {}

  const std::error_code& code() const noexcept { return code_; }

private:
  std::error_code code_;
};

} // namespace store
} // namespace gridstore

#endif // GRIDSTORE_STORE_ERROR_HPP
