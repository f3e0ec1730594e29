#ifndef RPIPE_CRYPTO_BOX_HPP
#define RPIPE_CRYPTO_BOX_HPP

#include <array>
#include <cstdint>
#include <string>
#include "common/types.hpp"
#include "crypto/crypto_error.hpp"

namespace rpipe::crypto {

// Chunk metadata authenticated alongside the ciphertext. Binding the position
// and lengths means a chunk cannot be replayed at another seq, and the
// end-of-stream flag cannot be forged.
struct AssociatedData {
  SessionId session_id;
  Seq seq = 0;
  bool is_last = false;
  uint32_t plaintext_len = 0;
  uint32_t compressed_len = 0;

  Bytes encode() const;
};

struct SealedChunk {
  Bytes ciphertext;
  Bytes tag;
};

class CryptoBox {
public:
  static constexpr size_t KEY_SIZE = 32;       // AES-256
  static constexpr size_t NONCE_SIZE = 12;     // GCM standard IV length
  static constexpr size_t TAG_SIZE = 16;
  static constexpr size_t SALT_SIZE = 32;
  static constexpr size_t VERIFIER_SIZE = 32;  // HMAC-SHA256

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Derives the session key and nonce base with HKDF-SHA256(secret, salt)
  CryptoBox(const std::string& secret, const Bytes& salt);
  ~CryptoBox();

  CryptoBox(const CryptoBox&) = delete;
  CryptoBox& operator=(const CryptoBox&) = delete;

  // Fresh per-session salt
  static Bytes generate_salt();


  // ---- KEY CONFIRMATION ----
  // HMAC over a fixed label; lets a reader detect a wrong secret up front
  Bytes verifier() const;
  bool verify(const Bytes& verifier) const;


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  SealedChunk seal(const AssociatedData& ad, const Bytes& plaintext) const;
  // Throws AuthError on tag mismatch
  Bytes open(const AssociatedData& ad, const Bytes& ciphertext, const Bytes& tag) const;


  // ---- NONCE MANAGEMENT ----
  // nonce_base XOR (0^4 || big-endian seq); unique while seq is never reused
  std::array<uint8_t, NONCE_SIZE> nonce_for(Seq seq) const;

private:
  std::array<uint8_t, KEY_SIZE> key_;
  std::array<uint8_t, NONCE_SIZE> nonce_base_;
};

} // namespace rpipe::crypto

#endif // RPIPE_CRYPTO_BOX_HPP
