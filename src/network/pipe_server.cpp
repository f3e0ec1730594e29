#include "network/pipe_server.hpp"
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

PipeServer::PipeServer(const config::PipeConfig& config, store::ChunkStore& store)
  : config_(config)
  , service_(store)
  , is_running_(false)
  , bound_port_(config.port)
  , sweep_timer_(io_context_) {
  BOOST_LOG_TRIVIAL(info) << "Pipe server: Initializing pipe server on " << config_.host << ":" << config_.port;
}

PipeServer::~PipeServer() {
  shutdown();
}

//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool PipeServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "Pipe server: Server already running";
    return false;
  }

  try {
    tcp::endpoint endpoint(boost::asio::ip::make_address(config_.host), config_.port);
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_, endpoint);
    bound_port_ = acceptor_->local_endpoint().port();

    is_running_ = true;

    BOOST_LOG_TRIVIAL(debug) << "Pipe server: Starting to accept connections";
    start_accept();
    schedule_sweep();

    // Start io_context in a separate thread
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Pipe server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "Pipe server: Listening on " << config_.host << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Pipe server: Failed to start server: " << e.what();
    acceptor_.reset();
    return false;
  }
}

void PipeServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  auto socket = std::make_shared<tcp::socket>(io_context_);
  acceptor_->async_accept(*socket,
    [this, socket](const boost::system::error_code& error) {
      if (!is_running_) {
        return;
      }
      if (!error) {
        boost::system::error_code ec;
        BOOST_LOG_TRIVIAL(debug) << "Pipe server: Accepted connection from " << socket->remote_endpoint(ec);
        reap_connections();
        spawn_connection(socket);
      } else {
        BOOST_LOG_TRIVIAL(error) << "Pipe server: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void PipeServer::schedule_sweep() {
  sweep_timer_.expires_after(config_.sweep_interval);
  sweep_timer_.async_wait([this](const boost::system::error_code& error) {
    if (error || !is_running_) {
      return;
    }
    try {
      service_.store().expire_sweep();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Pipe server: Sweep failed: " << e.what();
    }
    schedule_sweep();
  });
}

void PipeServer::shutdown() {
  if (!is_running_.exchange(false)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Pipe server: Initiating server shutdown";

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Pipe server: Error closing acceptor: " << ec.message();
    }
  }

  io_context_.stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }

  // Unblock connection threads stuck in read, then wait for them
  std::list<Connection> connections;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto& connection : connections_) {
      boost::system::error_code ec;
      if (connection.socket->is_open()) {
        connection.socket->shutdown(tcp::socket::shutdown_both, ec);
      }
    }
    connections.swap(connections_);
  }
  for (auto& connection : connections) {
    if (connection.worker.joinable()) {
      connection.worker.join();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Pipe server: Server shutdown complete";
}

std::size_t PipeServer::connection_count() {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  std::size_t active = 0;
  for (const auto& connection : connections_) {
    if (!connection.done->load()) {
      ++active;
    }
  }
  return active;
}

//==============================================
// CONNECTION HANDLING
//==============================================

void PipeServer::spawn_connection(std::shared_ptr<tcp::socket> socket) {
  boost::system::error_code ec;
  socket->set_option(tcp::no_delay(true), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Pipe server: Could not disable Nagle: " << ec.message();
  }

  auto done = std::make_shared<std::atomic<bool>>(false);
  std::lock_guard<std::mutex> lock(connections_mutex_);
  connections_.push_back(Connection{socket, std::thread([this, socket, done]() {
    serve_connection(socket);
    done->store(true);
  }), done});
}

void PipeServer::serve_connection(std::shared_ptr<tcp::socket> socket) {
  boost::system::error_code ec;
  const auto remote = socket->remote_endpoint(ec);
  std::size_t requests = 0;

  while (is_running_) {
    uint8_t prefix[FrameCodec::LENGTH_PREFIX_SIZE];
    boost::asio::read(*socket, boost::asio::buffer(prefix, sizeof(prefix)), ec);
    if (ec) {
      if (ec != boost::asio::error::eof) {
        BOOST_LOG_TRIVIAL(debug) << "Pipe server: Read error from " << remote << ": " << ec.message();
      }
      break;
    }

    const uint32_t length = FrameCodec::get_length(prefix);
    Bytes reply;
    bool keep_open = true;
    if (length == 0 || length > config_.max_request_bytes) {
      // Cannot skip the body safely, answer and drop the connection
      BOOST_LOG_TRIVIAL(warning) << "Pipe server: Request of " << length << " bytes from " << remote
                                 << " exceeds limit of " << config_.max_request_bytes;
      Response response;
      response.type = MessageType::ERROR;
      response.status = Status::BAD_REQUEST;
      reply = FrameCodec::encode_response(response);
      keep_open = false;
    } else {
      Bytes frame(length);
      boost::asio::read(*socket, boost::asio::buffer(frame), ec);
      if (ec) {
        BOOST_LOG_TRIVIAL(debug) << "Pipe server: Truncated request from " << remote << ": " << ec.message();
        break;
      }
      try {
        reply = service_.handle_frame(frame);
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Pipe server: Request handling failed: " << e.what();
        break;
      }
    }

    uint8_t reply_prefix[FrameCodec::LENGTH_PREFIX_SIZE];
    FrameCodec::put_length(reply_prefix, static_cast<uint32_t>(reply.size()));
    std::array<boost::asio::const_buffer, 2> buffers = {
      boost::asio::buffer(reply_prefix, sizeof(reply_prefix)),
      boost::asio::buffer(reply)
    };
    boost::asio::write(*socket, buffers, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "Pipe server: Write error to " << remote << ": " << ec.message();
      break;
    }
    ++requests;
    if (!keep_open) {
      break;
    }
  }

  {
    // Serialized with shutdown(), which may be touching the same socket
    std::lock_guard<std::mutex> lock(connections_mutex_);
    socket->close(ec);
  }
  BOOST_LOG_TRIVIAL(debug) << "Pipe server: Connection from " << remote << " closed after "
                           << requests << " requests";
}

void PipeServer::reap_connections() {
  std::list<Connection> finished;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
      if (it->done->load()) {
        finished.splice(finished.end(), connections_, it++);
      } else {
        ++it;
      }
    }
  }
  for (auto& connection : finished) {
    if (connection.worker.joinable()) {
      connection.worker.join();
    }
  }
}

} // namespace network
} // namespace rpipe
