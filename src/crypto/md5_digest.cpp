#include "crypto/md5_digest.hpp"
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace gridstore::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create digest context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Md5Digest::Md5Digest() : context_(std::make_unique<DigestContext>()) {
  if (!EVP_DigestInit_ex(context_->get(), EVP_md5(), nullptr)) {
    BOOST_LOG_TRIVIAL(error) << "Md5 digest: Failed to initialize MD5 context";
    throw DigestError("Failed to initialize MD5 context");
  }
}

Md5Digest::~Md5Digest() = default;

//==============================================
// DIGEST OPERATIONS
//==============================================

void Md5Digest::update(const uint8_t* data, size_t length) {
  if (finalized_) {
    throw DigestError("Digest already finalized");
  }
  if (length == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, length)) {
    BOOST_LOG_TRIVIAL(error) << "Md5 digest: Failed to update digest with " << length << " bytes";
    throw DigestError("Failed to update digest");
  }
}

std::string Md5Digest::hex_digest() {
  if (finalized_) {
    throw DigestError("Digest already finalized");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    BOOST_LOG_TRIVIAL(error) << "Md5 digest: Failed to finalize digest";
    throw DigestError("Failed to finalize digest");
  }
  finalized_ = true;

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::string Md5Digest::hex_of(const uint8_t* data, size_t length) {
  Md5Digest digest;
  digest.update(data, length);
  return digest.hex_digest();
}

} // namespace gridstore::crypto
