#include "crypto/digest.hpp"
#include "crypto/crypto_error.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <initializer_list>
#include <iomanip>
#include <memory>
#include <sstream>

namespace rpipe::crypto {

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }
};

} // namespace

std::string to_hex(const uint8_t* data, std::size_t size) {
  std::stringstream ss;
  for (std::size_t i = 0; i < size; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

std::string sha256_hex(std::initializer_list<const Bytes*> parts) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw CryptoError("Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
    throw CryptoError("Failed to initialize hash context");
  }

  for (const Bytes* part : parts) {
    if (!part->empty() && !EVP_DigestUpdate(ctx.get(), part->data(), part->size())) {
      throw CryptoError("Failed to update hash");
    }
  }

  if (!EVP_DigestFinal_ex(ctx.get(), hash, &hash_len)) {
    throw CryptoError("Failed to finalize hash");
  }

  return to_hex(hash, hash_len);
}

Bytes random_bytes(std::size_t size) {
  Bytes out(size);
  if (size > 0 && RAND_bytes(out.data(), static_cast<int>(size)) != 1) {
    throw CryptoError("Failed to generate random bytes");
  }
  return out;
}

std::string random_hex(std::size_t size) {
  Bytes raw = random_bytes(size);
  return to_hex(raw.data(), raw.size());
}

} // namespace rpipe::crypto
