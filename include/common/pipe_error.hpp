#ifndef RPIPE_COMMON_PIPE_ERROR_HPP
#define RPIPE_COMMON_PIPE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace rpipe {

class PipeError : public std::runtime_error {
public:
  explicit PipeError(const std::string& message)
    : std::runtime_error(message) {}
};

// Sequencing went wrong in a way resync could not repair
class ProtocolError : public PipeError {
public:
  explicit ProtocolError(const std::string& message)
    : PipeError("Protocol error: " + message) {}
};

// Corrupted or tampered data, never accepted silently
class IntegrityError : public PipeError {
public:
  explicit IntegrityError(const std::string& message)
    : PipeError("Integrity error: " + message) {}
};

class CapacityError : public PipeError {
public:
  explicit CapacityError(const std::string& message)
    : PipeError("Capacity error: " + message) {}
};

// Session is gone (expired, closed or never existed)
class LifecycleError : public PipeError {
public:
  explicit LifecycleError(const std::string& message)
    : PipeError("Lifecycle error: " + message) {}
};

class TransportError : public PipeError {
public:
  explicit TransportError(const std::string& message)
    : PipeError("Transport error: " + message) {}
};

// Retries exhausted; the transfer did not complete
class TransferFailed : public PipeError {
public:
  explicit TransferFailed(const std::string& message)
    : PipeError("Transfer failed: " + message) {}
};

class ConfigError : public PipeError {
public:
  explicit ConfigError(const std::string& message)
    : PipeError("Configuration error: " + message) {}
};

} // namespace rpipe

#endif // RPIPE_COMMON_PIPE_ERROR_HPP
