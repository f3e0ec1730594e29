#include "config/pipe_config.hpp"
#include "common/pipe_error.hpp"
#include <boost/log/trivial.hpp>

namespace rpipe {
namespace config {

std::chrono::milliseconds RetryPolicy::delay(uint32_t attempt) const {
  std::chrono::milliseconds result = backoff_base;
  for (uint32_t i = 0; i < attempt && result < backoff_cap; ++i) {
    result *= 2;
  }
  return result < backoff_cap ? result : backoff_cap;
}

void PipeConfig::validate() const {
  if (chunk_size == 0 || chunk_size > MAX_CHUNK_SIZE) {
    throw ConfigError("chunk size must be between 1 and " + std::to_string(MAX_CHUNK_SIZE) + " bytes");
  }
  if (buffer_capacity == 0) {
    throw ConfigError("buffer capacity must be at least one chunk");
  }
  if (session_ttl.count() <= 0) {
    throw ConfigError("session TTL must be positive");
  }
  if (sweep_interval.count() <= 0) {
    throw ConfigError("sweep interval must be positive");
  }
  if (append_wait.count() < 0 || read_idle_timeout.count() < 0) {
    throw ConfigError("wait timeouts must not be negative");
  }
  if (retry.max_attempts == 0) {
    throw ConfigError("retry policy needs at least one attempt");
  }
  if (retry.backoff_base.count() < 0 || retry.backoff_cap < retry.backoff_base) {
    throw ConfigError("backoff cap must not be below backoff base");
  }
  if (compression_level < -1 || compression_level > 9) {
    throw ConfigError("compression level must be between -1 and 9");
  }
  // A full chunk plus framing overhead has to fit in one request
  if (max_request_bytes < chunk_size + chunk_size / 64 + 4096) {
    throw ConfigError("max request size is too small for the chunk size");
  }
  if (io_timeout.count() <= 0) {
    throw ConfigError("I/O timeout must be positive");
  }
  BOOST_LOG_TRIVIAL(debug) << "Config: Validated (chunk size " << chunk_size
                           << ", capacity " << buffer_capacity
                           << ", ttl " << session_ttl.count() << "s)";
}

} // namespace config
} // namespace rpipe
