#include "common/pipe_error.hpp"
#include "config/command_line.hpp"
#include "logger/logger.hpp"
#include "network/pipe_server.hpp"
#include "store/chunk_store.hpp"
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <string>

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n"
            << "Runs the pipe server until SIGINT or SIGTERM.\n"
            << rpipe::config::usage_options()
            << "Example: " << program_name << " -h 0.0.0.0 -p 7070 --ttl 600\n";
}

bool run_server(const rpipe::config::ProgramOptions& options) {
  try {
    rpipe::store::ChunkStore store(options.pipe);
    rpipe::network::PipeServer server(options.pipe, store);

    if (!server.start_listener()) {
      std::cerr << "Error: Failed to start server on " << options.pipe.host << ":" << options.pipe.port << '\n';
      return false;
    }

    boost::asio::io_context signals_context;
    boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& error, int signal) {
      if (!error) {
        BOOST_LOG_TRIVIAL(info) << "Server: Received signal " << signal << ", shutting down";
      }
    });
    signals_context.run();

    server.shutdown();
    const auto stats = store.stats();
    BOOST_LOG_TRIVIAL(info) << "Server: Stopped with " << stats.sessions << " live sessions, "
                            << stats.expired_total << " expired";
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Server failed: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  rpipe::config::ProgramOptions options;
  try {
    options = rpipe::config::parse_command_line(argc, argv);
  } catch (const rpipe::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    print_usage(argv[0]);
    return 1;
  }

  if (options.help) {
    print_usage(argv[0]);
    return 0;
  }
  if (!options.command.empty()) {
    std::cerr << "Error: Unexpected argument: " << options.command << '\n';
    print_usage(argv[0]);
    return 1;
  }

  try {
    rpipe::logger::init_logging(options.log);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }

  return run_server(options) ? 0 : 1;
}
