#include <gtest/gtest.h>
#include "common/pipe_error.hpp"
#include "network/frame_codec.hpp"
#include "test_utils.hpp"

using namespace rpipe;
using namespace rpipe::network;

class FrameCodecTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_test_logging();
  }

  static store::Chunk sample_chunk() {
    store::Chunk chunk;
    chunk.session_id = "00112233445566778899aabbccddeeff";
    chunk.seq = 0x0102030405060708ULL;
    chunk.ciphertext = {0xde, 0xad, 0xbe, 0xef, 0x00};
    chunk.tag = Bytes(16, 0x5a);
    chunk.plaintext_len = 1234;
    chunk.compressed_len = 5;
    chunk.is_last = true;
    return chunk;
  }
};

TEST_F(FrameCodecTest, AppendRequestLayout) {
  Request request;
  request.type = MessageType::APPEND_CHUNK;
  request.chunk = sample_chunk();

  const Bytes frame = FrameCodec::encode_request(request);
  // type, id length, id, seq, flags, lengths, ciphertext, tag
  ASSERT_EQ(frame.size(), 1u + 4 + 32 + 8 + 1 + 4 + 4 + 4 + 5 + 4 + 16);
  EXPECT_EQ(frame[0], static_cast<uint8_t>(MessageType::APPEND_CHUNK));
  EXPECT_EQ(frame[4], 32);       // big-endian id length
  EXPECT_EQ(frame[37], 0x01);    // seq high byte first
  EXPECT_EQ(frame[44], 0x08);
  EXPECT_EQ(frame[45], 1);       // is_last

  const Request decoded = FrameCodec::decode_request(frame);
  EXPECT_EQ(decoded.type, MessageType::APPEND_CHUNK);
  EXPECT_EQ(decoded.session_id, request.chunk.session_id);
  EXPECT_EQ(decoded.seq, request.chunk.seq);
  EXPECT_EQ(decoded.chunk.ciphertext, request.chunk.ciphertext);
  EXPECT_EQ(decoded.chunk.tag, request.chunk.tag);
  EXPECT_EQ(decoded.chunk.plaintext_len, 1234u);
  EXPECT_EQ(decoded.chunk.compressed_len, 5u);
  EXPECT_TRUE(decoded.chunk.is_last);
}

TEST_F(FrameCodecTest, AttachResponseCarriesHandshake) {
  Response response;
  response.type = MessageType::ATTACH_SESSION;
  response.status = Status::OK;
  response.salt = Bytes(32, 1);
  response.verifier = Bytes(32, 2);
  response.state = session::SessionState::SEALED;
  response.seq = 42;

  const Response decoded = FrameCodec::decode_response(FrameCodec::encode_response(response));
  EXPECT_EQ(decoded.type, MessageType::ATTACH_SESSION);
  EXPECT_EQ(decoded.status, Status::OK);
  EXPECT_EQ(decoded.salt, response.salt);
  EXPECT_EQ(decoded.verifier, response.verifier);
  EXPECT_EQ(decoded.state, session::SessionState::SEALED);
  EXPECT_EQ(decoded.seq, 42u);
}

TEST_F(FrameCodecTest, FetchResponseOmitsChunkUnlessOk) {
  Response response;
  response.type = MessageType::FETCH_CHUNK;
  response.status = Status::NOT_YET_AVAILABLE;
  response.chunk = sample_chunk();

  const Bytes frame = FrameCodec::encode_response(response);
  EXPECT_EQ(frame.size(), 2u);
  const Response decoded = FrameCodec::decode_response(frame);
  EXPECT_EQ(decoded.status, Status::NOT_YET_AVAILABLE);
  EXPECT_TRUE(decoded.chunk.ciphertext.empty());

  response.status = Status::OK;
  const Response with_chunk = FrameCodec::decode_response(FrameCodec::encode_response(response));
  EXPECT_EQ(with_chunk.chunk.ciphertext, response.chunk.ciphertext);
  EXPECT_EQ(with_chunk.seq, response.chunk.seq);
}

TEST_F(FrameCodecTest, StatsResponse) {
  Response response;
  response.type = MessageType::SERVER_STATS;
  response.stats.sessions = 3;
  response.stats.buffered_chunks = 10;
  response.stats.buffered_bytes = 1u << 20;
  response.stats.expired_total = 7;

  const Response decoded = FrameCodec::decode_response(FrameCodec::encode_response(response));
  EXPECT_EQ(decoded.stats.sessions, 3u);
  EXPECT_EQ(decoded.stats.buffered_chunks, 10u);
  EXPECT_EQ(decoded.stats.buffered_bytes, 1u << 20);
  EXPECT_EQ(decoded.stats.expired_total, 7u);
}

TEST_F(FrameCodecTest, TruncatedFrameThrows) {
  Request request;
  request.type = MessageType::APPEND_CHUNK;
  request.chunk = sample_chunk();
  Bytes frame = FrameCodec::encode_request(request);

  frame.pop_back();
  EXPECT_THROW(FrameCodec::decode_request(frame), ProtocolError);
  EXPECT_THROW(FrameCodec::decode_request(Bytes{}), ProtocolError);
}

TEST_F(FrameCodecTest, OversizedLengthFieldThrows) {
  // FETCH_CHUNK claiming a 4 GiB session id
  const Bytes frame = {static_cast<uint8_t>(MessageType::FETCH_CHUNK), 0xff, 0xff, 0xff, 0xff, 'a'};
  EXPECT_THROW(FrameCodec::decode_request(frame), ProtocolError);
}

TEST_F(FrameCodecTest, TrailingBytesThrow) {
  Request request;
  request.type = MessageType::SERVER_STATS;
  Bytes frame = FrameCodec::encode_request(request);
  frame.push_back(0);
  EXPECT_THROW(FrameCodec::decode_request(frame), ProtocolError);
}

TEST_F(FrameCodecTest, UnknownValuesThrow) {
  EXPECT_THROW(FrameCodec::decode_request(Bytes{0x42}), ProtocolError);
  EXPECT_THROW(FrameCodec::decode_request(Bytes{0xff}), ProtocolError);
  EXPECT_THROW(FrameCodec::decode_response(Bytes{static_cast<uint8_t>(MessageType::CLOSE_SESSION), 0x99}),
               ProtocolError);

  Request request;
  request.type = MessageType::ERROR;
  EXPECT_THROW(FrameCodec::encode_request(request), ProtocolError);
}

TEST_F(FrameCodecTest, LengthPrefix) {
  uint8_t prefix[FrameCodec::LENGTH_PREFIX_SIZE];
  FrameCodec::put_length(prefix, 0x00010203);
  EXPECT_EQ(prefix[0], 0x00);
  EXPECT_EQ(prefix[3], 0x03);
  EXPECT_EQ(FrameCodec::get_length(prefix), 0x00010203u);
}
