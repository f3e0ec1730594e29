#ifndef RPIPE_CONFIG_COMMAND_LINE_HPP
#define RPIPE_CONFIG_COMMAND_LINE_HPP

#include <string>
#include <vector>
#include "config/pipe_config.hpp"
#include "logger/logger.hpp"

namespace rpipe {
namespace config {

struct ProgramOptions {
  // First positional argument (client subcommand), empty for the server
  std::string command;
  std::vector<std::string> arguments;
  PipeConfig pipe;
  logger::LogOptions log;
  std::string secret;
  bool help = false;
};

/**
 * Parses "--flag value" pairs on top of the defaults. The secret falls back
 * to the RPIPE_SECRET environment variable. Throws ConfigError on unknown
 * flags, missing or malformed values, or a PipeConfig that fails validation.
 */
ProgramOptions parse_command_line(int argc, const char* const argv[]);

// Flag reference shared by both executables
std::string usage_options();

} // namespace config
} // namespace rpipe

#endif // RPIPE_CONFIG_COMMAND_LINE_HPP
