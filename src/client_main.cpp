#include "client/pipe_reader.hpp"
#include "client/pipe_writer.hpp"
#include "client/retry.hpp"
#include "common/pipe_error.hpp"
#include "config/command_line.hpp"
#include "logger/logger.hpp"
#include "network/tcp_transport.hpp"
#include <iostream>
#include <string>

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " <command> [arguments] [options]\n"
            << "Commands:\n"
            << "  send                  Stream stdin into a new session, print its id to stdout first\n"
            << "  recv <session-id>     Stream a session to stdout\n"
            << "  status <session-id>   Show session state\n"
            << "  stats                 Show server totals\n"
            << rpipe::config::usage_options()
            << "Example: RPIPE_SECRET=s3cret " << program_name << " send < backup.tar\n";
}

namespace {

using rpipe::network::MessageType;

int run_send(rpipe::network::Transport& transport, const rpipe::config::ProgramOptions& options) {
  rpipe::client::PipeWriter writer(transport, options.pipe, options.secret);
  std::cout << writer.open() << std::endl;
  writer.write_stream(std::cin);
  writer.close();
  BOOST_LOG_TRIVIAL(info) << "Client: Sent " << writer.stats() << " (ratio "
                          << writer.stats().compression_ratio() << ")";
  return 0;
}

int run_recv(rpipe::network::Transport& transport, const rpipe::config::ProgramOptions& options) {
  rpipe::client::PipeReader reader(transport, options.pipe, options.secret, options.arguments.front());
  reader.read_stream(std::cout);
  BOOST_LOG_TRIVIAL(info) << "Client: Received " << reader.stats();
  return 0;
}

int run_status(rpipe::network::Transport& transport, const rpipe::config::ProgramOptions& options) {
  rpipe::network::Request request;
  request.type = MessageType::SESSION_STATUS;
  request.session_id = options.arguments.front();
  const auto response = rpipe::client::call_with_retry(transport, request, options.pipe.retry, "Client");
  if (response.status != rpipe::Status::OK) {
    std::cerr << "Error: " << response.status << '\n';
    return 1;
  }
  const auto& status = response.session_status;
  std::cout << "state:           " << status.state << '\n'
            << "next_write_seq:  " << status.next_write_seq << '\n'
            << "acked_count:     " << status.acked_count << '\n'
            << "buffered_chunks: " << status.buffered_chunks << '\n'
            << "buffered_bytes:  " << status.buffered_bytes << '\n'
            << "age_ms:          " << status.age_ms << '\n'
            << "idle_ms:         " << status.idle_ms << '\n';
  return 0;
}

int run_stats(rpipe::network::Transport& transport, const rpipe::config::ProgramOptions& options) {
  rpipe::network::Request request;
  request.type = MessageType::SERVER_STATS;
  const auto response = rpipe::client::call_with_retry(transport, request, options.pipe.retry, "Client");
  const auto& stats = response.stats;
  std::cout << "sessions:        " << stats.sessions << '\n'
            << "buffered_chunks: " << stats.buffered_chunks << '\n'
            << "buffered_bytes:  " << stats.buffered_bytes << '\n'
            << "expired_total:   " << stats.expired_total << '\n';
  return 0;
}

} // namespace

int main(int argc, char* argv[]) {
  rpipe::config::ProgramOptions options;
  try {
    options = rpipe::config::parse_command_line(argc, argv);
  } catch (const rpipe::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    print_usage(argv[0]);
    return 1;
  }

  if (options.help || options.command.empty()) {
    print_usage(argv[0]);
    return options.help ? 0 : 1;
  }

  const std::string& command = options.command;
  const bool needs_session = command == "recv" || command == "status";
  const bool needs_secret = command == "send" || command == "recv";
  if (command != "send" && command != "stats" && !needs_session) {
    std::cerr << "Error: Unknown command: " << command << '\n';
    print_usage(argv[0]);
    return 1;
  }
  if (needs_session && options.arguments.size() != 1) {
    std::cerr << "Error: " << command << " takes exactly one session id\n";
    return 1;
  }
  if (needs_secret && options.secret.empty()) {
    std::cerr << "Error: No secret given, set RPIPE_SECRET or pass --secret\n";
    return 1;
  }

  try {
    rpipe::logger::init_logging(options.log);
    std::ios::sync_with_stdio(false);

    rpipe::network::TcpTransport transport(options.pipe.host, options.pipe.port, options.pipe);
    if (command == "send") {
      return run_send(transport, options);
    } else if (command == "recv") {
      return run_recv(transport, options);
    } else if (command == "status") {
      return run_status(transport, options);
    }
    return run_stats(transport, options);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Client: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}
