#ifndef RPIPE_NETWORK_TRANSPORT_HPP
#define RPIPE_NETWORK_TRANSPORT_HPP

#include "network/message_frame.hpp"

namespace rpipe {
namespace network {

// Request/response channel between a client and the pipe server
class Transport {
public:
  virtual ~Transport() = default;

  // Throws TransportError when the exchange could not complete
  virtual Response round_trip(const Request& request) = 0;
};

} // namespace network
} // namespace rpipe

#endif // RPIPE_NETWORK_TRANSPORT_HPP
