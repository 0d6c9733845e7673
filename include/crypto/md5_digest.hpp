#ifndef GRIDSTORE_CRYPTO_MD5_DIGEST_HPP
#define GRIDSTORE_CRYPTO_MD5_DIGEST_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include "crypto_error.hpp"

namespace gridstore::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Streaming MD5 accumulator. Feed bytes with update(), read the result once with hex_digest().
class Md5Digest {
public:
  static constexpr size_t DIGEST_SIZE = 16;  // 128 bits

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Md5Digest();
  ~Md5Digest();

  Md5Digest(const Md5Digest&) = delete;
  Md5Digest& operator=(const Md5Digest&) = delete;


  // ---- DIGEST OPERATIONS ----
  void update(const uint8_t* data, size_t length);
  // Finalizes the digest and returns it as 32 lowercase hex characters
  std::string hex_digest();

  // One-shot helper
  static std::string hex_of(const uint8_t* data, size_t length);

private:
  // ---- PARAMETERS ----
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;
};

} // namespace gridstore::crypto

#endif // GRIDSTORE_CRYPTO_MD5_DIGEST_HPP
