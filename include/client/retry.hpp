#ifndef RPIPE_CLIENT_RETRY_HPP
#define RPIPE_CLIENT_RETRY_HPP

#include <cstdint>
#include <string>
#include "config/pipe_config.hpp"
#include "network/transport.hpp"

namespace rpipe {
namespace client {

/**
 * Sends a request, retrying transport failures with exponential backoff.
 * Server statuses are returned as-is; only TransportError is retried.
 * @param retries incremented once per failed attempt when not null
 * @throws TransferFailed once policy.max_attempts attempts have failed
 */
network::Response call_with_retry(network::Transport& transport,
                                  const network::Request& request,
                                  const config::RetryPolicy& policy,
                                  const std::string& component,
                                  uint64_t* retries = nullptr);

// Sleeps for policy.delay(attempt)
void backoff(const config::RetryPolicy& policy, uint32_t attempt);

} // namespace client
} // namespace rpipe

#endif // RPIPE_CLIENT_RETRY_HPP
