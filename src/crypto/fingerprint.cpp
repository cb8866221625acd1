#include "crypto/fingerprint.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace crunch::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

namespace {

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  // Initialize new digest context
  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw FingerprintError("Failed to create digest context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  // Access the underlying context
  EVP_MD_CTX* get() { return ctx; }
};

} // namespace


//==============================================
// FINGERPRINT GENERATION
//==============================================

Fingerprint fingerprint(std::string_view bytes) {
  DigestContext context;

  // Initialize the context with MD5
  if (!EVP_DigestInit_ex(context.get(), EVP_md5(), nullptr)) {
    BOOST_LOG_TRIVIAL(error) << "Fingerprint: Failed to initialize MD5 digest";
    throw FingerprintError("Failed to initialize digest");
  }

  // Feed the block into the digest
  if (!EVP_DigestUpdate(context.get(), bytes.data(), bytes.size())) {
    BOOST_LOG_TRIVIAL(error) << "Fingerprint: Failed to update digest with " << bytes.size() << " bytes";
    throw FingerprintError("Failed to update digest");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (!EVP_DigestFinal_ex(context.get(), digest, &digest_len)) {
    BOOST_LOG_TRIVIAL(error) << "Fingerprint: Failed to finalize digest";
    throw FingerprintError("Failed to finalize digest");
  }

  if (digest_len != FINGERPRINT_SIZE) {
    throw FingerprintError("Unexpected digest length: " + std::to_string(digest_len));
  }

  Fingerprint result;
  std::copy(digest, digest + FINGERPRINT_SIZE, result.begin());
  return result;
}

std::string to_hex(const Fingerprint& fp) {
  std::stringstream ss;
  for (uint8_t byte : fp) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(byte);
  }
  return ss.str();
}

} // namespace crunch::crypto
