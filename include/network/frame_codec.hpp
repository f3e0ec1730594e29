#ifndef RPIPE_NETWORK_FRAME_CODEC_HPP
#define RPIPE_NETWORK_FRAME_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <boost/endian/conversion.hpp>
#include "network/message_frame.hpp"

namespace rpipe {
namespace network {

/**
 * Binary encoding of requests and responses. A frame is a 1-byte message
 * type followed by big-endian fixed-width integers and u32-length-prefixed
 * byte strings. On a stream each frame is preceded by its u32 length.
 * Decoding throws ProtocolError on truncated, oversized or unknown input.
 */
class FrameCodec {
public:
  static constexpr std::size_t LENGTH_PREFIX_SIZE = sizeof(uint32_t);

  // ---- SERIALIZATION AND DESERIALIZATION ----
  static Bytes encode_request(const Request& request);
  static Request decode_request(const Bytes& frame);
  static Bytes encode_response(const Response& response);
  static Response decode_response(const Bytes& frame);


  // ---- LENGTH PREFIX ----
  static void put_length(uint8_t* out, uint32_t length) {
    const uint32_t network_length = boost::endian::native_to_big(length);
    std::memcpy(out, &network_length, sizeof(network_length));
  }
  static uint32_t get_length(const uint8_t* in) {
    uint32_t network_length;
    std::memcpy(&network_length, in, sizeof(network_length));
    return boost::endian::big_to_native(network_length);
  }
};

} // namespace network
} // namespace rpipe

#endif // RPIPE_NETWORK_FRAME_CODEC_HPP
