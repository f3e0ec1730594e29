#include "client/retry.hpp"
#include "common/pipe_error.hpp"
#include <boost/log/trivial.hpp>
#include <thread>

namespace rpipe {
namespace client {

network::Response call_with_retry(network::Transport& transport,
                                  const network::Request& request,
                                  const config::RetryPolicy& policy,
                                  const std::string& component,
                                  uint64_t* retries) {
  std::string last_error;
  for (uint32_t attempt = 0; attempt < policy.max_attempts; ++attempt) {
    if (attempt > 0) {
      backoff(policy, attempt - 1);
    }
    try {
      return transport.round_trip(request);
    } catch (const TransportError& e) {
      last_error = e.what();
      if (retries) {
        ++*retries;
      }
      BOOST_LOG_TRIVIAL(warning) << component << ": " << network::message_type_to_string(request.type)
                                 << " attempt " << (attempt + 1) << "/" << policy.max_attempts
                                 << " failed: " << last_error;
    }
  }

  BOOST_LOG_TRIVIAL(error) << component << ": Giving up on " << network::message_type_to_string(request.type)
                           << " after " << policy.max_attempts << " attempts";
  throw TransferFailed(std::string(network::message_type_to_string(request.type)) + " failed after " +
                       std::to_string(policy.max_attempts) + " attempts: " + last_error);
}

void backoff(const config::RetryPolicy& policy, uint32_t attempt) {
  std::this_thread::sleep_for(policy.delay(attempt));
}

} // namespace client
} // namespace rpipe
