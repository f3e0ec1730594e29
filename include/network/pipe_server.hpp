#pragma once

#include <boost/asio.hpp>
#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "config/pipe_config.hpp"
#include "network/pipe_service.hpp"

namespace rpipe {
namespace network {

class PipeServer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  PipeServer(const config::PipeConfig& config, store::ChunkStore& store);
  ~PipeServer();

  PipeServer(const PipeServer&) = delete;
  PipeServer& operator=(const PipeServer&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  void shutdown();


  // ---- GETTERS ----
  // Actual bound port; differs from the configured one when that was 0
  uint16_t port() const { return bound_port_; }
  bool is_running() const { return is_running_; }
  std::size_t connection_count();

private:
  struct Connection {
    std::shared_ptr<boost::asio::ip::tcp::socket> socket;
    std::thread worker;
    std::shared_ptr<std::atomic<bool>> done;
  };

  // ---- PARAMETERS ----
  const config::PipeConfig config_;
  PipeService service_;

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_;
  uint16_t bound_port_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  boost::asio::steady_timer sweep_timer_;

  std::mutex connections_mutex_;
  std::list<Connection> connections_;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop that handles incoming connections
  void start_accept();
  void schedule_sweep();


  // ---- CONNECTION HANDLING ----
  void spawn_connection(std::shared_ptr<boost::asio::ip::tcp::socket> socket);
  // Blocking request loop for one client, runs on its own thread
  void serve_connection(std::shared_ptr<boost::asio::ip::tcp::socket> socket);
  // Joins worker threads whose clients have disconnected
  void reap_connections();
};

} // namespace network
} // namespace rpipe
