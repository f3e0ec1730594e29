#include "network/pipe_service.hpp"
#include "common/pipe_error.hpp"
#include "crypto/crypto_box.hpp"
#include "network/frame_codec.hpp"
#include <boost/log/trivial.hpp>

namespace rpipe {
namespace network {

PipeService::PipeService(store::ChunkStore& store)
  : store_(store) {
}

//==============================================
// DISPATCH
//==============================================

Response PipeService::handle(const Request& request) {
  Response response;
  response.type = request.type;

  switch (request.type) {
    case MessageType::OPEN_SESSION:
      return handle_open(request);

    case MessageType::ATTACH_SESSION: {
      auto handshake = store_.attach_session(request.session_id);
      if (!handshake) {
        response.status = Status::SESSION_NOT_FOUND;
        break;
      }
      response.salt = std::move(handshake->salt);
      response.verifier = std::move(handshake->verifier);
      response.state = handshake->state;
      response.seq = handshake->next_write_seq;
      break;
    }

    case MessageType::APPEND_CHUNK:
      return handle_append(request);

    case MessageType::FETCH_CHUNK:
      return handle_fetch(request);

    case MessageType::ACK:
      return handle_ack(request);

    case MessageType::CLOSE_SESSION:
      response.status = store_.close_session(request.session_id);
      break;

    case MessageType::SESSION_STATUS: {
      auto status = store_.status(request.session_id);
      if (!status) {
        response.status = Status::SESSION_NOT_FOUND;
        break;
      }
      response.session_status = *status;
      break;
    }

    case MessageType::SERVER_STATS:
      response.stats = store_.stats();
      break;

    case MessageType::ERROR:
      response.type = MessageType::ERROR;
      response.status = Status::BAD_REQUEST;
      break;
  }
  return response;
}

Bytes PipeService::handle_frame(const Bytes& frame) {
  Request request;
  try {
    request = FrameCodec::decode_request(frame);
  } catch (const ProtocolError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Pipe service: Rejecting malformed request: " << e.what();
    Response response;
    response.type = MessageType::ERROR;
    response.status = Status::BAD_REQUEST;
    return FrameCodec::encode_response(response);
  }
  return FrameCodec::encode_response(handle(request));
}

//==============================================
// REQUEST HANDLERS
//==============================================

Response PipeService::handle_open(const Request& request) {
  Response response;
  response.type = MessageType::OPEN_SESSION;

  if (request.salt.size() != crypto::CryptoBox::SALT_SIZE ||
      request.verifier.size() != crypto::CryptoBox::VERIFIER_SIZE) {
    BOOST_LOG_TRIVIAL(warning) << "Pipe service: Open with salt of " << request.salt.size()
                               << " bytes and verifier of " << request.verifier.size() << " bytes";
    response.status = Status::BAD_REQUEST;
    return response;
  }

  response.session_id = store_.open_session(request.salt, request.verifier);
  return response;
}

Response PipeService::handle_append(const Request& request) {
  Response response;
  response.type = MessageType::APPEND_CHUNK;

  const std::string problem = validate_chunk(request.chunk);
  if (!problem.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "Pipe service: Rejecting chunk " << request.chunk.seq
                               << " of session " << request.chunk.session_id << ": " << problem;
    response.status = Status::BAD_REQUEST;
    return response;
  }

  const auto result = store_.append(request.chunk);
  response.status = result.status;
  response.seq = result.expected;
  return response;
}

Response PipeService::handle_fetch(const Request& request) {
  Response response;
  response.type = MessageType::FETCH_CHUNK;

  auto result = store_.fetch(request.session_id, request.seq);
  response.status = result.status;
  response.seq = request.seq;
  if (result.chunk) {
    response.chunk = std::move(*result.chunk);
  }
  return response;
}

Response PipeService::handle_ack(const Request& request) {
  Response response;
  response.type = MessageType::ACK;

  const auto result = store_.ack(request.session_id, request.seq);
  response.status = result.status;
  response.seq = result.expected;
  return response;
}

//==============================================
// UTILITY METHODS
//==============================================

std::string PipeService::validate_chunk(const store::Chunk& chunk) {
  if (chunk.session_id.empty()) {
    return "missing session id";
  }
  if (chunk.tag.size() != crypto::CryptoBox::TAG_SIZE) {
    return "tag of " + std::to_string(chunk.tag.size()) + " bytes";
  }
  if (chunk.compressed_len != chunk.ciphertext.size()) {
    return "compressed_len " + std::to_string(chunk.compressed_len) + " does not match ciphertext of " +
           std::to_string(chunk.ciphertext.size()) + " bytes";
  }
  if (chunk.plaintext_len > config::PipeConfig::MAX_CHUNK_SIZE) {
    return "plaintext_len " + std::to_string(chunk.plaintext_len) + " exceeds maximum chunk size";
  }
  return {};
}

} // namespace network
} // namespace rpipe
