#ifndef RPIPE_NETWORK_LOOPBACK_TRANSPORT_HPP
#define RPIPE_NETWORK_LOOPBACK_TRANSPORT_HPP

#include "network/pipe_service.hpp"
#include "network/transport.hpp"

namespace rpipe {
namespace network {

// In-process transport. Requests still pass through the frame codec so the
// wire encoding is exercised without sockets.
class LoopbackTransport : public Transport {
public:
  explicit LoopbackTransport(PipeService& service) : service_(service) {}

  Response round_trip(const Request& request) override;

private:
  PipeService& service_;
};

} // namespace network
} // namespace rpipe

#endif // RPIPE_NETWORK_LOOPBACK_TRANSPORT_HPP
