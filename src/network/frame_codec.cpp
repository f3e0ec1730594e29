#include "network/frame_codec.hpp"
#include "common/pipe_error.hpp"
#include <boost/log/trivial.hpp>
#include <cstring>

namespace rpipe {
namespace network {

namespace {

using session::SessionState;

class FrameWriter {
public:
  void put_u8(uint8_t value) { out_.push_back(value); }

  void put_u32(uint32_t value) {
    const uint32_t network_value = boost::endian::native_to_big(value);
    append(&network_value, sizeof(network_value));
  }

  void put_u64(uint64_t value) {
    const uint64_t network_value = boost::endian::native_to_big(value);
    append(&network_value, sizeof(network_value));
  }

  void put_bytes(const Bytes& bytes) {
    put_u32(static_cast<uint32_t>(bytes.size()));
    append(bytes.data(), bytes.size());
  }

  void put_string(const std::string& value) {
    put_u32(static_cast<uint32_t>(value.size()));
    append(value.data(), value.size());
  }

  Bytes take() { return std::move(out_); }

private:
  Bytes out_;

  void append(const void* data, std::size_t size) {
    const auto* bytes = static_cast<const uint8_t*>(data);
    out_.insert(out_.end(), bytes, bytes + size);
  }
};

class FrameReader {
public:
  explicit FrameReader(const Bytes& frame) : frame_(frame) {}

  uint8_t get_u8() {
    require(1, "u8");
    return frame_[pos_++];
  }

  uint32_t get_u32() {
    uint32_t network_value;
    read(&network_value, sizeof(network_value), "u32");
    return boost::endian::big_to_native(network_value);
  }

  uint64_t get_u64() {
    uint64_t network_value;
    read(&network_value, sizeof(network_value), "u64");
    return boost::endian::big_to_native(network_value);
  }

  Bytes get_bytes() {
    const uint32_t size = get_u32();
    require(size, "byte string");
    Bytes bytes(frame_.begin() + pos_, frame_.begin() + pos_ + size);
    pos_ += size;
    return bytes;
  }

  std::string get_string() {
    const uint32_t size = get_u32();
    require(size, "string");
    std::string value(reinterpret_cast<const char*>(frame_.data()) + pos_, size);
    pos_ += size;
    return value;
  }

  void expect_end() const {
    if (pos_ != frame_.size()) {
      throw ProtocolError("frame has " + std::to_string(frame_.size() - pos_) + " trailing bytes");
    }
  }

private:
  const Bytes& frame_;
  std::size_t pos_ = 0;

  void require(std::size_t size, const char* what) const {
    if (frame_.size() - pos_ < size) {
      throw ProtocolError(std::string("frame truncated while reading ") + what);
    }
  }

  void read(void* out, std::size_t size, const char* what) {
    require(size, what);
    std::memcpy(out, frame_.data() + pos_, size);
    pos_ += size;
  }
};

MessageType to_message_type(uint8_t raw) {
  if ((raw >= static_cast<uint8_t>(MessageType::OPEN_SESSION) &&
       raw <= static_cast<uint8_t>(MessageType::SERVER_STATS)) ||
      raw == static_cast<uint8_t>(MessageType::ERROR)) {
    return static_cast<MessageType>(raw);
  }
  throw ProtocolError("unknown message type " + std::to_string(raw));
}

Status to_status(uint8_t raw) {
  if (!is_valid_status(raw)) {
    throw ProtocolError("unknown status " + std::to_string(raw));
  }
  return static_cast<Status>(raw);
}

SessionState to_state(uint8_t raw) {
  if (raw > static_cast<uint8_t>(SessionState::EXPIRED)) {
    throw ProtocolError("unknown session state " + std::to_string(raw));
  }
  return static_cast<SessionState>(raw);
}

void put_chunk(FrameWriter& writer, const store::Chunk& chunk) {
  writer.put_string(chunk.session_id);
  writer.put_u64(chunk.seq);
  writer.put_u8(chunk.is_last ? 1 : 0);
  writer.put_u32(chunk.plaintext_len);
  writer.put_u32(chunk.compressed_len);
  writer.put_bytes(chunk.ciphertext);
  writer.put_bytes(chunk.tag);
}

store::Chunk get_chunk(FrameReader& reader) {
  store::Chunk chunk;
  chunk.session_id = reader.get_string();
  chunk.seq = reader.get_u64();
  const uint8_t flags = reader.get_u8();
  if (flags > 1) {
    throw ProtocolError("invalid chunk flags " + std::to_string(flags));
  }
  chunk.is_last = flags == 1;
  chunk.plaintext_len = reader.get_u32();
  chunk.compressed_len = reader.get_u32();
  chunk.ciphertext = reader.get_bytes();
  chunk.tag = reader.get_bytes();
  return chunk;
}

} // namespace

//==============================================
// REQUESTS
//==============================================

Bytes FrameCodec::encode_request(const Request& request) {
  FrameWriter writer;
  writer.put_u8(static_cast<uint8_t>(request.type));

  switch (request.type) {
    case MessageType::OPEN_SESSION:
      writer.put_bytes(request.salt);
      writer.put_bytes(request.verifier);
      break;
    case MessageType::ATTACH_SESSION:
    case MessageType::CLOSE_SESSION:
    case MessageType::SESSION_STATUS:
      writer.put_string(request.session_id);
      break;
    case MessageType::APPEND_CHUNK:
      put_chunk(writer, request.chunk);
      break;
    case MessageType::FETCH_CHUNK:
    case MessageType::ACK:
      writer.put_string(request.session_id);
      writer.put_u64(request.seq);
      break;
    case MessageType::SERVER_STATS:
      break;
    case MessageType::ERROR:
      throw ProtocolError("ERROR is not a request type");
  }
  return writer.take();
}

Request FrameCodec::decode_request(const Bytes& frame) {
  FrameReader reader(frame);
  Request request;
  request.type = to_message_type(reader.get_u8());

  switch (request.type) {
    case MessageType::OPEN_SESSION:
      request.salt = reader.get_bytes();
      request.verifier = reader.get_bytes();
      break;
    case MessageType::ATTACH_SESSION:
    case MessageType::CLOSE_SESSION:
    case MessageType::SESSION_STATUS:
      request.session_id = reader.get_string();
      break;
    case MessageType::APPEND_CHUNK:
      request.chunk = get_chunk(reader);
      request.session_id = request.chunk.session_id;
      request.seq = request.chunk.seq;
      break;
    case MessageType::FETCH_CHUNK:
    case MessageType::ACK:
      request.session_id = reader.get_string();
      request.seq = reader.get_u64();
      break;
    case MessageType::SERVER_STATS:
      break;
    case MessageType::ERROR:
      throw ProtocolError("ERROR is not a request type");
  }
  reader.expect_end();

  BOOST_LOG_TRIVIAL(trace) << "Frame codec: Decoded " << message_type_to_string(request.type)
                           << " request of " << frame.size() << " bytes";
  return request;
}

//==============================================
// RESPONSES
//==============================================

Bytes FrameCodec::encode_response(const Response& response) {
  FrameWriter writer;
  writer.put_u8(static_cast<uint8_t>(response.type));
  writer.put_u8(static_cast<uint8_t>(response.status));

  switch (response.type) {
    case MessageType::OPEN_SESSION:
      writer.put_string(response.session_id);
      break;
    case MessageType::ATTACH_SESSION:
      writer.put_bytes(response.salt);
      writer.put_bytes(response.verifier);
      writer.put_u8(static_cast<uint8_t>(response.state));
      writer.put_u64(response.seq);
      break;
    case MessageType::APPEND_CHUNK:
    case MessageType::ACK:
      writer.put_u64(response.seq);
      break;
    case MessageType::FETCH_CHUNK:
      // Chunk body only travels with OK
      if (response.status == Status::OK) {
        put_chunk(writer, response.chunk);
      }
      break;
    case MessageType::SESSION_STATUS: {
      const auto& status = response.session_status;
      writer.put_u8(static_cast<uint8_t>(status.state));
      writer.put_u64(status.next_write_seq);
      writer.put_u64(status.acked_count);
      writer.put_u64(status.buffered_chunks);
      writer.put_u64(status.buffered_bytes);
      writer.put_u64(status.age_ms);
      writer.put_u64(status.idle_ms);
      break;
    }
    case MessageType::SERVER_STATS:
      writer.put_u64(response.stats.sessions);
      writer.put_u64(response.stats.buffered_chunks);
      writer.put_u64(response.stats.buffered_bytes);
      writer.put_u64(response.stats.expired_total);
      break;
    case MessageType::CLOSE_SESSION:
    case MessageType::ERROR:
      break;
  }
  return writer.take();
}

Response FrameCodec::decode_response(const Bytes& frame) {
  FrameReader reader(frame);
  Response response;
  response.type = to_message_type(reader.get_u8());
  response.status = to_status(reader.get_u8());

  switch (response.type) {
    case MessageType::OPEN_SESSION:
      response.session_id = reader.get_string();
      break;
    case MessageType::ATTACH_SESSION:
      response.salt = reader.get_bytes();
      response.verifier = reader.get_bytes();
      response.state = to_state(reader.get_u8());
      response.seq = reader.get_u64();
      break;
    case MessageType::APPEND_CHUNK:
    case MessageType::ACK:
      response.seq = reader.get_u64();
      break;
    case MessageType::FETCH_CHUNK:
      if (response.status == Status::OK) {
        response.chunk = get_chunk(reader);
        response.seq = response.chunk.seq;
      }
      break;
    case MessageType::SESSION_STATUS: {
      auto& status = response.session_status;
      status.state = to_state(reader.get_u8());
      status.next_write_seq = reader.get_u64();
      status.acked_count = reader.get_u64();
      status.buffered_chunks = reader.get_u64();
      status.buffered_bytes = reader.get_u64();
      status.age_ms = reader.get_u64();
      status.idle_ms = reader.get_u64();
      break;
    }
    case MessageType::SERVER_STATS:
      response.stats.sessions = reader.get_u64();
      response.stats.buffered_chunks = reader.get_u64();
      response.stats.buffered_bytes = reader.get_u64();
      response.stats.expired_total = reader.get_u64();
      break;
    case MessageType::CLOSE_SESSION:
    case MessageType::ERROR:
      break;
  }
  reader.expect_end();
  return response;
}

} // namespace network
} // namespace rpipe
