#include "config/command_line.hpp"
#include "common/pipe_error.hpp"
#include <cstdlib>
#include <functional>
#include <limits>
#include <unordered_map>

namespace rpipe {
namespace config {

namespace {

uint64_t parse_number(const std::string& flag, const std::string& value, uint64_t max) {
  std::size_t consumed = 0;
  unsigned long long number = 0;
  try {
    number = std::stoull(value, &consumed);
  } catch (const std::exception&) {
    throw ConfigError("invalid value '" + value + "' for " + flag);
  }
  if (consumed != value.size() || value.front() == '-' || number > max) {
    throw ConfigError("invalid value '" + value + "' for " + flag);
  }
  return number;
}

int parse_level(const std::string& flag, const std::string& value) {
  if (value == "-1") {
    return -1;
  }
  return static_cast<int>(parse_number(flag, value, 9));
}

} // namespace

ProgramOptions parse_command_line(int argc, const char* const argv[]) {
  ProgramOptions options;
  PipeConfig& pipe = options.pipe;
  const uint64_t u32_max = std::numeric_limits<uint32_t>::max();
  const uint64_t u64_max = std::numeric_limits<uint64_t>::max();

  using Setter = std::function<void(const std::string& flag, const std::string& value)>;
  const std::unordered_map<std::string, Setter> flag_map = {
    {"--host", [&](const std::string&, const std::string& v) { pipe.host = v; }},
    {"--port", [&](const std::string& f, const std::string& v) {
      pipe.port = static_cast<uint16_t>(parse_number(f, v, std::numeric_limits<uint16_t>::max()));
    }},
    {"--chunk-size", [&](const std::string& f, const std::string& v) {
      pipe.chunk_size = parse_number(f, v, PipeConfig::MAX_CHUNK_SIZE);
    }},
    {"--capacity", [&](const std::string& f, const std::string& v) {
      pipe.buffer_capacity = parse_number(f, v, u32_max);
    }},
    {"--ttl", [&](const std::string& f, const std::string& v) {
      pipe.session_ttl = std::chrono::seconds(parse_number(f, v, u32_max));
    }},
    {"--sweep-interval", [&](const std::string& f, const std::string& v) {
      pipe.sweep_interval = std::chrono::milliseconds(parse_number(f, v, u32_max));
    }},
    {"--append-wait", [&](const std::string& f, const std::string& v) {
      pipe.append_wait = std::chrono::milliseconds(parse_number(f, v, u32_max));
    }},
    {"--idle-timeout", [&](const std::string& f, const std::string& v) {
      pipe.read_idle_timeout = std::chrono::milliseconds(parse_number(f, v, u32_max));
    }},
    {"--io-timeout", [&](const std::string& f, const std::string& v) {
      pipe.io_timeout = std::chrono::milliseconds(parse_number(f, v, u32_max));
    }},
    {"--retries", [&](const std::string& f, const std::string& v) {
      pipe.retry.max_attempts = static_cast<uint32_t>(parse_number(f, v, u32_max));
    }},
    {"--backoff-base", [&](const std::string& f, const std::string& v) {
      pipe.retry.backoff_base = std::chrono::milliseconds(parse_number(f, v, u32_max));
    }},
    {"--backoff-cap", [&](const std::string& f, const std::string& v) {
      pipe.retry.backoff_cap = std::chrono::milliseconds(parse_number(f, v, u32_max));
    }},
    {"--level", [&](const std::string& f, const std::string& v) {
      pipe.compression_level = parse_level(f, v);
    }},
    {"--max-request", [&](const std::string& f, const std::string& v) {
      pipe.max_request_bytes = parse_number(f, v, u64_max);
    }},
    {"--secret", [&](const std::string&, const std::string& v) { options.secret = v; }},
    {"--log-level", [&](const std::string&, const std::string& v) {
      options.log.min_level = logger::parse_severity(v);
    }},
    {"--log-file", [&](const std::string&, const std::string& v) { options.log.log_file = v; }}
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);

    if (arg == "--help") {
      options.help = true;
      continue;
    }
    if (arg == "--quiet") {
      options.log.console = false;
      continue;
    }
    if (arg.empty() || arg.front() != '-') {
      if (options.command.empty()) {
        options.command = arg;
      } else {
        options.arguments.push_back(arg);
      }
      continue;
    }

    auto it = flag_map.find(arg == "-h" ? "--host" : arg == "-p" ? "--port" : arg);
    if (it == flag_map.end()) {
      throw ConfigError("unknown argument " + arg);
    }
    if (i + 1 >= argc) {
      throw ConfigError("missing value for " + arg);
    }
    it->second(arg, argv[++i]);
  }

  if (options.secret.empty()) {
    if (const char* env = std::getenv("RPIPE_SECRET")) {
      options.secret = env;
    }
  }

  pipe.validate();
  return options;
}

std::string usage_options() {
  return
    "Options:\n"
    "  -h, --host <addr>        Server address (default 127.0.0.1)\n"
    "  -p, --port <port>        Server port (default 7070)\n"
    "  --secret <secret>        Shared secret (default $RPIPE_SECRET)\n"
    "  --chunk-size <bytes>     Plaintext bytes per chunk (default 65536)\n"
    "  --capacity <chunks>      Unacked chunks retained per session (default 64)\n"
    "  --ttl <seconds>          Session inactivity timeout (default 300)\n"
    "  --sweep-interval <ms>    Expiry sweep period (default 5000)\n"
    "  --append-wait <ms>       Backpressure wait before StoreFull (default 2000)\n"
    "  --idle-timeout <ms>      Reader wait for the next chunk (default 300000)\n"
    "  --io-timeout <ms>        Socket operation timeout (default 30000)\n"
    "  --retries <n>            Attempts per request (default 8)\n"
    "  --backoff-base <ms>      First retry delay (default 50)\n"
    "  --backoff-cap <ms>       Largest retry delay (default 2000)\n"
    "  --level <-1..9>          zlib compression level (default 6)\n"
    "  --max-request <bytes>    Largest accepted frame (default 33554432)\n"
    "  --log-level <level>      trace, debug, info, warning, error, fatal\n"
    "  --log-file <path>        Also log to a rotating file\n"
    "  --quiet                  No console logging\n";
}

} // namespace config
} // namespace rpipe
