#ifndef RPIPE_NETWORK_TCP_TRANSPORT_HPP
#define RPIPE_NETWORK_TCP_TRANSPORT_HPP

#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <string>
#include "config/pipe_config.hpp"
#include "network/transport.hpp"

namespace rpipe {
namespace network {

/**
 * Blocking client side of the pipe protocol over TCP. One request is in
 * flight at a time. Every socket operation is bounded by io_timeout; after
 * any failure the connection is dropped and re-established on the next call.
 */
class TcpTransport : public Transport {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TcpTransport(const std::string& host, uint16_t port, const config::PipeConfig& config);
  ~TcpTransport() override;

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  Response round_trip(const Request& request) override;

  bool is_connected() const;
  void disconnect();

private:
  // ---- PARAMETERS ----
  const std::string host_;
  const uint16_t port_;
  const std::size_t max_frame_bytes_;
  const std::chrono::milliseconds io_timeout_;

  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::socket> socket_;


  // ---- CONNECTION MANAGEMENT ----
  void ensure_connected();


  // ---- DEADLINE HANDLING ----
  // Runs the io_context until the pending operation completes or io_timeout
  // elapses; throws TransportError on timeout or failure
  void run_with_deadline(boost::system::error_code& ec, const char* what);

  void write_frame(const Bytes& frame);
  Bytes read_frame();
};

} // namespace network
} // namespace rpipe

#endif // RPIPE_NETWORK_TCP_TRANSPORT_HPP
