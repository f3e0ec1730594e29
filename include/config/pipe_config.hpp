#ifndef RPIPE_CONFIG_PIPE_CONFIG_HPP
#define RPIPE_CONFIG_PIPE_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace rpipe {
namespace config {

struct RetryPolicy {
  uint32_t max_attempts = 8;
  std::chrono::milliseconds backoff_base{50};
  std::chrono::milliseconds backoff_cap{2000};

  // Delay before retry number `attempt` (0-based): min(cap, base * 2^attempt)
  std::chrono::milliseconds delay(uint32_t attempt) const;
};

struct PipeConfig {
  static constexpr std::size_t MAX_CHUNK_SIZE = 16 * 1024 * 1024;

  // ---- PIPE PARAMETERS ----
  std::size_t chunk_size = 64 * 1024;
  std::size_t buffer_capacity = 64;
  std::chrono::seconds session_ttl{300};
  std::chrono::milliseconds sweep_interval{5000};
  std::chrono::milliseconds append_wait{2000};
  std::chrono::milliseconds read_idle_timeout{300000};
  RetryPolicy retry;
  int compression_level = 6;

  // ---- NETWORK PARAMETERS ----
  std::string host = "127.0.0.1";
  uint16_t port = 7070;
  std::size_t max_request_bytes = 32 * 1024 * 1024;
  std::chrono::milliseconds io_timeout{30000};

  // Throws ConfigError on the first out-of-range option
  void validate() const;
};

} // namespace config
} // namespace rpipe

#endif // RPIPE_CONFIG_PIPE_CONFIG_HPP
