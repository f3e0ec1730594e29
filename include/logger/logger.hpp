#ifndef RPIPE_LOGGER_HPP
#define RPIPE_LOGGER_HPP

#include <cstddef>
#include <string>
#include <boost/log/trivial.hpp>

namespace rpipe {
namespace logger {

struct LogOptions {
  boost::log::trivial::severity_level min_level = boost::log::trivial::info;
  // Empty path disables the file sink
  std::string log_file;
  bool console = true;
  std::size_t rotation_size = 10 * 1024 * 1024;  // 10 MB
};

// Maps "trace".."fatal" to a Boost.Log severity, throws ConfigError otherwise
boost::log::trivial::severity_level parse_severity(const std::string& name);

// Replaces any existing sinks with the ones described by options
void init_logging(const LogOptions& options);

} // namespace logger
} // namespace rpipe

#endif // RPIPE_LOGGER_HPP
