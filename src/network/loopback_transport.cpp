#include "network/loopback_transport.hpp"
#include "network/frame_codec.hpp"

namespace rpipe {
namespace network {

Response LoopbackTransport::round_trip(const Request& request) {
  const Bytes reply = service_.handle_frame(FrameCodec::encode_request(request));
  return FrameCodec::decode_response(reply);
}

} // namespace network
} // namespace rpipe
