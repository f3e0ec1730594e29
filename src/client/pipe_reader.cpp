#include "client/pipe_reader.hpp"
#include "client/retry.hpp"
#include "common/pipe_error.hpp"
#include <boost/log/trivial.hpp>

namespace rpipe {
namespace client {

using network::MessageType;
using network::Request;
using network::Response;

namespace {
const std::string kComponent = "Pipe reader";
} // namespace

PipeReader::PipeReader(network::Transport& transport, const config::PipeConfig& config,
                       std::string secret, SessionId session_id)
  : transport_(transport)
  , config_(config)
  , secret_(std::move(secret))
  , session_id_(std::move(session_id)) {
  config_.validate();
  if (secret_.empty()) {
    throw ConfigError("pipe secret must not be empty");
  }
  if (session_id_.empty()) {
    throw ConfigError("session id must not be empty");
  }
}

//==============================================
// SESSION CONTROL
//==============================================

void PipeReader::attach() {
  if (box_) {
    return;
  }

  Request request;
  request.type = MessageType::ATTACH_SESSION;
  request.session_id = session_id_;
  const Response response = call_with_retry(transport_, request, config_.retry, kComponent, &stats_.retries);

  if (response.status == Status::SESSION_NOT_FOUND) {
    throw LifecycleError("session " + session_id_ + " not found");
  }
  if (response.status != Status::OK) {
    throw ProtocolError("attach_session rejected: " + std::string(status_to_string(response.status)));
  }
  if (response.salt.size() != crypto::CryptoBox::SALT_SIZE) {
    throw ProtocolError("handshake salt of " + std::to_string(response.salt.size()) + " bytes");
  }

  auto box = std::make_unique<crypto::CryptoBox>(secret_, response.salt);
  if (!box->verify(response.verifier)) {
    throw crypto::AuthError("secret does not match session " + session_id_);
  }
  box_ = std::move(box);
  BOOST_LOG_TRIVIAL(info) << "Pipe reader: Attached to session " << session_id_ << " ("
                          << response.state << ", " << response.seq << " chunks written)";
}

//==============================================
// DATA TRANSFER
//==============================================

bool PipeReader::next(std::string& out) {
  if (finished_) {
    return false;
  }
  attach();

  // A chunk whose ack failed is already decompressed; only the ack is retried
  if (!held_) {
    store::Chunk chunk = fetch_next();
    const Bytes compressed = open_chunk(chunk);
    Bytes plaintext = decompressor_.decompress(compressed);
    if (plaintext.size() != chunk.plaintext_len) {
      throw IntegrityError("chunk " + std::to_string(chunk.seq) + " decompressed to " +
                           std::to_string(plaintext.size()) + " bytes, expected " +
                           std::to_string(chunk.plaintext_len));
    }
    if (chunk.is_last && !decompressor_.finished()) {
      throw IntegrityError("final chunk does not terminate the compressed stream");
    }
    held_ = HeldChunk{chunk.seq, chunk.is_last, std::move(plaintext), chunk.size_bytes()};
  }

  acknowledge(held_->seq);
  const HeldChunk done = std::move(*held_);
  held_.reset();

  ++next_seq_;
  stats_.chunks++;
  stats_.plaintext_bytes += done.plaintext.size();
  stats_.wire_bytes += done.wire_bytes;
  out.assign(done.plaintext.begin(), done.plaintext.end());

  if (done.is_last) {
    finished_ = true;
    finish();
  }
  return true;
}

void PipeReader::read_stream(std::ostream& output) {
  std::string piece;
  while (next(piece)) {
    output.write(piece.data(), static_cast<std::streamsize>(piece.size()));
    if (!output) {
      throw TransferFailed("output stream write error");
    }
  }
  output.flush();
}

//==============================================
// CHUNK PIPELINE
//==============================================

store::Chunk PipeReader::fetch_next() {
  Request request;
  request.type = MessageType::FETCH_CHUNK;
  request.session_id = session_id_;
  request.seq = next_seq_;

  const auto deadline = Clock::now() + config_.read_idle_timeout;
  uint32_t polls = 0;

  for (;;) {
    Response response = call_with_retry(transport_, request, config_.retry, kComponent, &stats_.retries);

    switch (response.status) {
      case Status::OK:
        if (response.chunk.seq != next_seq_ || response.chunk.session_id != session_id_) {
          throw ProtocolError("asked for chunk " + std::to_string(next_seq_) + ", got " +
                              std::to_string(response.chunk.seq));
        }
        return std::move(response.chunk);

      case Status::NOT_YET_AVAILABLE:
        if (Clock::now() >= deadline) {
          throw TransferFailed("no chunk " + std::to_string(next_seq_) + " within " +
                               std::to_string(config_.read_idle_timeout.count()) + "ms");
        }
        BOOST_LOG_TRIVIAL(trace) << "Pipe reader: Chunk " << next_seq_ << " not yet available";
        backoff(config_.retry, polls++);
        break;

      case Status::EVICTED:
        throw ProtocolError("chunk " + std::to_string(next_seq_) + " was already acknowledged and evicted");

      case Status::SESSION_SEALED:
        throw ProtocolError("stream truncated: session sealed before chunk " + std::to_string(next_seq_));

      case Status::SESSION_NOT_FOUND:
        throw LifecycleError("session " + session_id_ + " expired during transfer");

      default:
        throw ProtocolError("unexpected fetch status: " + std::string(status_to_string(response.status)));
    }
  }
}

Bytes PipeReader::open_chunk(store::Chunk& chunk) {
  for (uint32_t attempt = 1;; ++attempt) {
    crypto::AssociatedData ad;
    ad.session_id = session_id_;
    ad.seq = chunk.seq;
    ad.is_last = chunk.is_last;
    ad.plaintext_len = chunk.plaintext_len;
    ad.compressed_len = chunk.compressed_len;

    try {
      return box_->open(ad, chunk.ciphertext, chunk.tag);
    } catch (const crypto::AuthError& e) {
      if (attempt >= config_.retry.max_attempts) {
        BOOST_LOG_TRIVIAL(error) << "Pipe reader: Chunk " << chunk.seq << " failed authentication "
                                 << attempt << " times";
        throw;
      }
      BOOST_LOG_TRIVIAL(warning) << "Pipe reader: Chunk " << chunk.seq << " failed authentication, re-fetching";
      ++stats_.retries;
      chunk = fetch_next();
    }
  }
}

void PipeReader::acknowledge(Seq seq) {
  Request request;
  request.type = MessageType::ACK;
  request.session_id = session_id_;
  request.seq = seq;
  const Response response = call_with_retry(transport_, request, config_.retry, kComponent, &stats_.retries);

  if (response.status == Status::SESSION_NOT_FOUND) {
    throw LifecycleError("session " + session_id_ + " expired during transfer");
  }
  if (response.status != Status::OK) {
    throw ProtocolError("ack of " + std::to_string(seq) + " rejected: " +
                        std::string(status_to_string(response.status)));
  }
}

void PipeReader::finish() {
  Request request;
  request.type = MessageType::CLOSE_SESSION;
  request.session_id = session_id_;

  // Every chunk is delivered and acked at this point; a failed close only
  // leaves the session to the TTL sweep
  try {
    const Response response = call_with_retry(transport_, request, config_.retry, kComponent, &stats_.retries);
    // NOT_FOUND: the writer's close already released the drained session
    if (response.status != Status::OK && response.status != Status::SESSION_NOT_FOUND) {
      BOOST_LOG_TRIVIAL(warning) << "Pipe reader: close_session of " << session_id_ << " rejected: "
                                 << status_to_string(response.status);
    }
  } catch (const TransferFailed& e) {
    BOOST_LOG_TRIVIAL(warning) << "Pipe reader: Could not close session " << session_id_
                               << ", leaving it to expire: " << e.what();
  }
  BOOST_LOG_TRIVIAL(info) << "Pipe reader: Finished session " << session_id_ << " after " << stats_;
}

} // namespace client
} // namespace rpipe
