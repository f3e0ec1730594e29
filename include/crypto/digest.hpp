#ifndef RPIPE_CRYPTO_DIGEST_HPP
#define RPIPE_CRYPTO_DIGEST_HPP

#include <cstddef>
#include <initializer_list>
#include <string>
#include "common/types.hpp"

namespace rpipe::crypto {

// SHA-256 of the concatenated parts, hex encoded
std::string sha256_hex(std::initializer_list<const Bytes*> parts);

// `size` bytes from the OpenSSL CSPRNG
Bytes random_bytes(std::size_t size);

// `size` random bytes, hex encoded
std::string random_hex(std::size_t size);

std::string to_hex(const uint8_t* data, std::size_t size);

} // namespace rpipe::crypto

#endif // RPIPE_CRYPTO_DIGEST_HPP
