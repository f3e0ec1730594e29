#include "network/tcp_transport.hpp"
#include "common/pipe_error.hpp"
#include "network/frame_codec.hpp"
#include <boost/log/trivial.hpp>
#include <array>

namespace rpipe {
namespace network {

using boost::asio::ip::tcp;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TcpTransport::TcpTransport(const std::string& host, uint16_t port, const config::PipeConfig& config)
  : host_(host)
  , port_(port)
  , max_frame_bytes_(config.max_request_bytes)
  , io_timeout_(config.io_timeout) {
  BOOST_LOG_TRIVIAL(debug) << "TCP transport: Created for " << host_ << ":" << port_;
}

TcpTransport::~TcpTransport() {
  disconnect();
}

//==============================================
// REQUEST/RESPONSE EXCHANGE
//==============================================

Response TcpTransport::round_trip(const Request& request) {
  const Bytes frame = FrameCodec::encode_request(request);
  try {
    ensure_connected();
    write_frame(frame);
    Bytes reply = read_frame();
    return FrameCodec::decode_response(reply);
  } catch (const TransportError&) {
    disconnect();
    throw;
  } catch (const ProtocolError& e) {
    // The stream is no longer aligned on a frame boundary
    disconnect();
    throw TransportError(e.what());
  }
}

//==============================================
// CONNECTION MANAGEMENT
//==============================================

bool TcpTransport::is_connected() const {
  return socket_ && socket_->is_open();
}

void TcpTransport::disconnect() {
  if (!socket_) {
    return;
  }
  boost::system::error_code ec;
  socket_->shutdown(tcp::socket::shutdown_both, ec);
  socket_->close(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "TCP transport: Error closing socket: " << ec.message();
  }
  socket_.reset();
}

void TcpTransport::ensure_connected() {
  if (is_connected()) {
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "TCP transport: Connecting to " << host_ << ":" << port_;
  tcp::resolver resolver(io_context_);
  boost::system::error_code ec;
  auto endpoints = resolver.resolve(host_, std::to_string(port_), ec);
  if (ec) {
    throw TransportError("cannot resolve " + host_ + ": " + ec.message());
  }

  socket_ = std::make_unique<tcp::socket>(io_context_);
  ec = boost::asio::error::would_block;
  boost::asio::async_connect(*socket_, endpoints,
    [&ec](const boost::system::error_code& result, const tcp::endpoint&) {
      ec = result;
    });
  run_with_deadline(ec, "connect");

  socket_->set_option(tcp::no_delay(true), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "TCP transport: Could not disable Nagle: " << ec.message();
  }
  BOOST_LOG_TRIVIAL(info) << "TCP transport: Connected to " << host_ << ":" << port_;
}

//==============================================
// FRAME I/O
//==============================================

void TcpTransport::write_frame(const Bytes& frame) {
  uint8_t prefix[FrameCodec::LENGTH_PREFIX_SIZE];
  FrameCodec::put_length(prefix, static_cast<uint32_t>(frame.size()));
  std::array<boost::asio::const_buffer, 2> buffers = {
    boost::asio::buffer(prefix, sizeof(prefix)),
    boost::asio::buffer(frame)
  };

  boost::system::error_code ec = boost::asio::error::would_block;
  boost::asio::async_write(*socket_, buffers,
    [&ec](const boost::system::error_code& result, std::size_t) {
      ec = result;
    });
  run_with_deadline(ec, "write");
}

Bytes TcpTransport::read_frame() {
  uint8_t prefix[FrameCodec::LENGTH_PREFIX_SIZE];
  boost::system::error_code ec = boost::asio::error::would_block;
  boost::asio::async_read(*socket_, boost::asio::buffer(prefix, sizeof(prefix)),
    [&ec](const boost::system::error_code& result, std::size_t) {
      ec = result;
    });
  run_with_deadline(ec, "read length");

  const uint32_t length = FrameCodec::get_length(prefix);
  if (length == 0 || length > max_frame_bytes_) {
    throw TransportError("server sent frame of " + std::to_string(length) + " bytes");
  }

  Bytes frame(length);
  ec = boost::asio::error::would_block;
  boost::asio::async_read(*socket_, boost::asio::buffer(frame),
    [&ec](const boost::system::error_code& result, std::size_t) {
      ec = result;
    });
  run_with_deadline(ec, "read frame");
  return frame;
}

void TcpTransport::run_with_deadline(boost::system::error_code& ec, const char* what) {
  io_context_.restart();
  io_context_.run_for(io_timeout_);

  if (!io_context_.stopped()) {
    // Deadline hit with the operation still pending: cancel it and drain
    boost::system::error_code ignored;
    socket_->close(ignored);
    io_context_.run();
    throw TransportError(std::string(what) + " timed out after " +
                         std::to_string(io_timeout_.count()) + "ms");
  }

  if (ec) {
    throw TransportError(std::string(what) + " failed: " + ec.message());
  }
}

} // namespace network
} // namespace rpipe
