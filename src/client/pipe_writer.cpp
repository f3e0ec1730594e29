#include "client/pipe_writer.hpp"
#include "client/retry.hpp"
#include "common/pipe_error.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace rpipe {
namespace client {

using network::MessageType;
using network::Request;
using network::Response;

namespace {
const std::string kComponent = "Pipe writer";
} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

PipeWriter::PipeWriter(network::Transport& transport, const config::PipeConfig& config, std::string secret)
  : transport_(transport)
  , config_(config)
  , secret_(std::move(secret)) {
  config_.validate();
  if (secret_.empty()) {
    throw ConfigError("pipe secret must not be empty");
  }
}

PipeWriter::~PipeWriter() {
  if (box_ && !closed_) {
    BOOST_LOG_TRIVIAL(warning) << "Pipe writer: Session " << session_id_
                               << " destroyed without close, reader will see a truncated stream";
  }
}

//==============================================
// SESSION CONTROL
//==============================================

const SessionId& PipeWriter::open() {
  if (box_) {
    throw LifecycleError("writer already opened session " + session_id_);
  }

  const Bytes salt = crypto::CryptoBox::generate_salt();
  auto box = std::make_unique<crypto::CryptoBox>(secret_, salt);

  Request request;
  request.type = MessageType::OPEN_SESSION;
  request.salt = salt;
  request.verifier = box->verifier();

  const Response response = call_with_retry(transport_, request, config_.retry, kComponent, &stats_.retries);
  if (response.status != Status::OK || response.session_id.empty()) {
    throw ProtocolError("open_session rejected: " + std::string(status_to_string(response.status)));
  }

  session_id_ = response.session_id;
  box_ = std::move(box);
  compressor_ = std::make_unique<codec::Compressor>(config_.compression_level);
  BOOST_LOG_TRIVIAL(info) << "Pipe writer: Opened session " << session_id_;
  return session_id_;
}

void PipeWriter::close() {
  require_open("close");

  // The final chunk is produced once; a retried close only resends it
  flush();
  if (!final_produced()) {
    seal_chunk(pending_.data(), pending_.size(), true);
    pending_.clear();
    flush();
  }

  Request request;
  request.type = MessageType::CLOSE_SESSION;
  request.session_id = session_id_;
  const Response response = call_with_retry(transport_, request, config_.retry, kComponent, &stats_.retries);

  // NOT_FOUND: the reader already drained and released the session
  if (response.status != Status::OK && response.status != Status::SESSION_NOT_FOUND) {
    throw ProtocolError("close_session rejected: " + std::string(status_to_string(response.status)));
  }
  closed_ = true;
  BOOST_LOG_TRIVIAL(info) << "Pipe writer: Closed session " << session_id_ << " after " << stats_;
}

//==============================================
// DATA TRANSFER
//==============================================

void PipeWriter::write(const uint8_t* data, std::size_t size) {
  require_open("write");
  if (final_produced()) {
    throw LifecycleError("write after close");
  }
  pending_.insert(pending_.end(), data, data + size);
  flush();

  // Keep at least one byte behind so close() has the final chunk
  while (pending_.size() > config_.chunk_size) {
    seal_chunk(pending_.data(), config_.chunk_size, false);
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(config_.chunk_size));
    flush();
  }
}

void PipeWriter::write_stream(std::istream& input) {
  std::vector<char> buffer(config_.chunk_size);
  while (input) {
    input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize got = input.gcount();
    if (got > 0) {
      write(reinterpret_cast<const uint8_t*>(buffer.data()), static_cast<std::size_t>(got));
    }
  }
  if (input.bad()) {
    throw TransferFailed("input stream read error");
  }
}

//==============================================
// CHUNK PIPELINE
//==============================================

void PipeWriter::seal_chunk(const uint8_t* data, std::size_t size, bool last) {
  const Bytes compressed = compressor_->compress(data, size, last);

  crypto::AssociatedData ad;
  ad.session_id = session_id_;
  ad.seq = next_seq_;
  ad.is_last = last;
  ad.plaintext_len = static_cast<uint32_t>(size);
  ad.compressed_len = static_cast<uint32_t>(compressed.size());

  crypto::SealedChunk sealed = box_->seal(ad, compressed);

  store::Chunk chunk;
  chunk.session_id = session_id_;
  chunk.seq = next_seq_++;
  chunk.ciphertext = std::move(sealed.ciphertext);
  chunk.tag = std::move(sealed.tag);
  chunk.plaintext_len = ad.plaintext_len;
  chunk.compressed_len = ad.compressed_len;
  chunk.is_last = last;

  stats_.chunks++;
  stats_.plaintext_bytes += size;
  stats_.wire_bytes += chunk.size_bytes();

  history_.push_back(std::move(chunk));
  // Unsent chunks are never dropped
  while (history_.size() > config_.buffer_capacity && history_.front().seq < next_unsent_) {
    history_.pop_front();
  }
}

void PipeWriter::flush() {
  if (next_unsent_ < next_seq_) {
    transmit(next_unsent_);
  }
}

bool PipeWriter::final_produced() const {
  return !history_.empty() && history_.back().is_last;
}

void PipeWriter::transmit(Seq from) {
  const Seq newest = history_.back().seq;
  Seq cursor = from;
  uint32_t setbacks = 0;

  while (cursor <= newest) {
    Request request;
    request.type = MessageType::APPEND_CHUNK;
    request.chunk = retained(cursor);

    const Response response = call_with_retry(transport_, request, config_.retry, kComponent, &stats_.retries);

    switch (response.status) {
      case Status::ACCEPTED:
      case Status::DUPLICATE:
        ++cursor;
        next_unsent_ = std::max(next_unsent_, cursor);
        setbacks = 0;
        break;

      case Status::SEQUENCE_MISMATCH:
        if (++setbacks >= config_.retry.max_attempts) {
          throw ProtocolError("could not resynchronize session " + session_id_ + " at seq " +
                              std::to_string(cursor));
        }
        if (response.seq > newest + 1) {
          throw ProtocolError("server expects seq " + std::to_string(response.seq) +
                              " but only " + std::to_string(newest + 1) + " chunks were produced");
        }
        BOOST_LOG_TRIVIAL(warning) << "Pipe writer: Resyncing session " << session_id_ << " from seq "
                                   << cursor << " to " << response.seq;
        cursor = response.seq;
        next_unsent_ = std::max(next_unsent_, cursor);
        break;

      case Status::STORE_FULL:
        if (++setbacks >= config_.retry.max_attempts) {
          throw CapacityError("session " + session_id_ + " stayed full for " +
                              std::to_string(setbacks) + " attempts");
        }
        BOOST_LOG_TRIVIAL(debug) << "Pipe writer: Store full at seq " << cursor << ", backing off";
        ++stats_.retries;
        backoff(config_.retry, setbacks - 1);
        break;

      case Status::SEQUENCE_CONFLICT:
        throw ProtocolError("server holds different content for seq " + std::to_string(cursor));

      case Status::SESSION_NOT_FOUND:
        throw LifecycleError("session " + session_id_ + " expired during transfer");

      case Status::SESSION_SEALED:
        throw LifecycleError("session " + session_id_ + " is already sealed");

      default:
        throw ProtocolError("unexpected append status: " + std::string(status_to_string(response.status)));
    }
  }
}

const store::Chunk& PipeWriter::retained(Seq seq) const {
  if (history_.empty() || seq < history_.front().seq || seq > history_.back().seq) {
    throw ProtocolError("chunk " + std::to_string(seq) + " is no longer retained for resend");
  }
  return history_[seq - history_.front().seq];
}

void PipeWriter::require_open(const char* operation) const {
  if (!box_) {
    throw LifecycleError(std::string(operation) + " before open");
  }
  if (closed_) {
    throw LifecycleError(std::string(operation) + " after close");
  }
}

} // namespace client
} // namespace rpipe
