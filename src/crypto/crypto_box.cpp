#include "crypto/crypto_box.hpp"
#include "crypto/digest.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <cstring>

namespace rpipe::crypto {

namespace {

constexpr char kKdfInfo[] = "rpipe/v1 session";
constexpr char kVerifyLabel[] = "rpipe/v1 verify";

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw CryptoError("Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  CipherContext(const CipherContext&) = delete;
  CipherContext& operator=(const CipherContext&) = delete;

  EVP_CIPHER_CTX* get() { return ctx; }
};

void append_u32(Bytes& out, uint32_t value) {
  uint32_t be = boost::endian::native_to_big(value);
  const uint8_t* p = reinterpret_cast<const uint8_t*>(&be);
  out.insert(out.end(), p, p + sizeof(be));
}

void append_u64(Bytes& out, uint64_t value) {
  uint64_t be = boost::endian::native_to_big(value);
  const uint8_t* p = reinterpret_cast<const uint8_t*>(&be);
  out.insert(out.end(), p, p + sizeof(be));
}

// HKDF-SHA256 through the OpenSSL 3 KDF API
void hkdf_sha256(const std::string& secret, const Bytes& salt, uint8_t* out, std::size_t out_len) {
  EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "HKDF", nullptr);
  if (!kdf) {
    throw KeyDerivationError("Failed to fetch HKDF algorithm");
  }
  EVP_KDF_CTX* kctx = EVP_KDF_CTX_new(kdf);
  EVP_KDF_free(kdf);
  if (!kctx) {
    throw KeyDerivationError("Failed to create HKDF context");
  }

  OSSL_PARAM params[5];
  params[0] = OSSL_PARAM_construct_utf8_string("digest", const_cast<char*>("SHA256"), 0);
  params[1] = OSSL_PARAM_construct_octet_string(
    "key", const_cast<char*>(secret.data()), secret.size());
  params[2] = OSSL_PARAM_construct_octet_string(
    "salt", const_cast<uint8_t*>(salt.data()), salt.size());
  params[3] = OSSL_PARAM_construct_octet_string(
    "info", const_cast<char*>(kKdfInfo), sizeof(kKdfInfo) - 1);
  params[4] = OSSL_PARAM_construct_end();

  const int result = EVP_KDF_derive(kctx, out, out_len, params);
  EVP_KDF_CTX_free(kctx);
  if (result != 1) {
    throw KeyDerivationError("HKDF derivation failed");
  }
}

} // namespace

Bytes AssociatedData::encode() const {
  Bytes out;
  out.reserve(4 + session_id.size() + 8 + 1 + 4 + 4);
  append_u32(out, static_cast<uint32_t>(session_id.size()));
  out.insert(out.end(), session_id.begin(), session_id.end());
  append_u64(out, seq);
  out.push_back(is_last ? 1 : 0);
  append_u32(out, plaintext_len);
  append_u32(out, compressed_len);
  return out;
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CryptoBox::CryptoBox(const std::string& secret, const Bytes& salt) {
  if (secret.empty()) {
    throw KeyDerivationError("Shared secret must not be empty");
  }
  if (salt.size() != SALT_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Crypto box: Invalid salt size: " << salt.size()
                             << " bytes (expected " << SALT_SIZE << " bytes)";
    throw KeyDerivationError("Invalid salt size");
  }

  std::array<uint8_t, KEY_SIZE + NONCE_SIZE> okm;
  hkdf_sha256(secret, salt, okm.data(), okm.size());
  std::memcpy(key_.data(), okm.data(), KEY_SIZE);
  std::memcpy(nonce_base_.data(), okm.data() + KEY_SIZE, NONCE_SIZE);
  OPENSSL_cleanse(okm.data(), okm.size());

  BOOST_LOG_TRIVIAL(debug) << "Crypto box: Session key derived";
}

CryptoBox::~CryptoBox() {
  OPENSSL_cleanse(key_.data(), key_.size());
  OPENSSL_cleanse(nonce_base_.data(), nonce_base_.size());
}

Bytes CryptoBox::generate_salt() {
  return random_bytes(SALT_SIZE);
}

//==============================================
// KEY CONFIRMATION
//==============================================

Bytes CryptoBox::verifier() const {
  Bytes out(EVP_MAX_MD_SIZE);
  unsigned int out_len = 0;
  if (!HMAC(EVP_sha256(), key_.data(), static_cast<int>(key_.size()),
            reinterpret_cast<const unsigned char*>(kVerifyLabel), sizeof(kVerifyLabel) - 1,
            out.data(), &out_len)) {
    throw CryptoError("Failed to compute key verifier");
  }
  out.resize(out_len);
  return out;
}

bool CryptoBox::verify(const Bytes& candidate) const {
  const Bytes expected = verifier();
  return candidate.size() == expected.size() &&
         CRYPTO_memcmp(candidate.data(), expected.data(), expected.size()) == 0;
}

//==============================================
// NONCE MANAGEMENT
//==============================================

std::array<uint8_t, CryptoBox::NONCE_SIZE> CryptoBox::nonce_for(Seq seq) const {
  std::array<uint8_t, NONCE_SIZE> nonce = nonce_base_;
  const uint64_t be_seq = boost::endian::native_to_big(seq);
  const uint8_t* seq_bytes = reinterpret_cast<const uint8_t*>(&be_seq);
  for (size_t i = 0; i < sizeof(be_seq); ++i) {
    nonce[NONCE_SIZE - sizeof(be_seq) + i] ^= seq_bytes[i];
  }
  return nonce;
}

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

SealedChunk CryptoBox::seal(const AssociatedData& ad, const Bytes& plaintext) const {
  BOOST_LOG_TRIVIAL(trace) << "Crypto box: Sealing chunk " << ad.seq << " of " << plaintext.size() << " bytes";

  const auto nonce = nonce_for(ad.seq);
  const Bytes aad = ad.encode();
  CipherContext ctx;

  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
    throw CryptoError("Failed to initialize AES-256-GCM");
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1) {
    throw CryptoError("Failed to set nonce length");
  }
  if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce.data()) != 1) {
    throw CryptoError("Failed to set key and nonce");
  }

  int outlen = 0;
  if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen, aad.data(), static_cast<int>(aad.size())) != 1) {
    throw CryptoError("Failed to add associated data");
  }

  SealedChunk sealed;
  sealed.ciphertext.resize(plaintext.size());
  int ciphertext_len = 0;
  if (!plaintext.empty() &&
      EVP_EncryptUpdate(ctx.get(), sealed.ciphertext.data(), &ciphertext_len,
                        plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
    throw CryptoError("Encryption failed");
  }

  int final_len = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), sealed.ciphertext.data() + ciphertext_len, &final_len) != 1) {
    throw CryptoError("Encryption finalization failed");
  }
  sealed.ciphertext.resize(ciphertext_len + final_len);

  sealed.tag.resize(TAG_SIZE);
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE), sealed.tag.data()) != 1) {
    throw CryptoError("Failed to get authentication tag");
  }
  return sealed;
}

Bytes CryptoBox::open(const AssociatedData& ad, const Bytes& ciphertext, const Bytes& tag) const {
  BOOST_LOG_TRIVIAL(trace) << "Crypto box: Opening chunk " << ad.seq << " of " << ciphertext.size() << " bytes";

  if (tag.size() != TAG_SIZE) {
    throw AuthError("Invalid tag size for chunk " + std::to_string(ad.seq));
  }

  const auto nonce = nonce_for(ad.seq);
  const Bytes aad = ad.encode();
  CipherContext ctx;

  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
    throw CryptoError("Failed to initialize AES-256-GCM");
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1) {
    throw CryptoError("Failed to set nonce length");
  }
  if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce.data()) != 1) {
    throw CryptoError("Failed to set key and nonce");
  }

  int outlen = 0;
  if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen, aad.data(), static_cast<int>(aad.size())) != 1) {
    throw CryptoError("Failed to add associated data");
  }

  Bytes plaintext(ciphertext.size());
  int plaintext_len = 0;
  if (!ciphertext.empty() &&
      EVP_DecryptUpdate(ctx.get(), plaintext.data(), &plaintext_len,
                        ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
    throw CryptoError("Decryption failed");
  }

  Bytes tag_copy(tag);
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE), tag_copy.data()) != 1) {
    throw CryptoError("Failed to set authentication tag");
  }

  int final_len = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plaintext_len, &final_len) != 1) {
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    BOOST_LOG_TRIVIAL(warning) << "Crypto box: Tag mismatch for chunk " << ad.seq;
    throw AuthError("Tag mismatch for chunk " + std::to_string(ad.seq));
  }
  plaintext.resize(plaintext_len + final_len);
  return plaintext;
}

} // namespace rpipe::crypto
