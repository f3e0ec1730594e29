#ifndef RPIPE_CODEC_STREAM_CODEC_HPP
#define RPIPE_CODEC_STREAM_CODEC_HPP

#include <cstddef>
#include <zlib.h>
#include "common/pipe_error.hpp"
#include "common/types.hpp"

namespace rpipe {
namespace codec {

class CodecError : public IntegrityError {
public:
  explicit CodecError(const std::string& message)
    : IntegrityError("Codec: " + message) {}
};

inline constexpr std::size_t kCodecBufferSize = 64 * 1024;

// Streaming deflate compressor. Every call produces one frame that ends on a
// byte boundary (sync flush), so frames can be shipped independently, but the
// dictionary carries over from frame to frame.
class Compressor {
public:
  Compressor(const Compressor&) = delete;
  Compressor& operator=(const Compressor&) = delete;

  explicit Compressor(int level = Z_DEFAULT_COMPRESSION);
  ~Compressor();

  // Compresses one chunk; `last` terminates the stream
  Bytes compress(const uint8_t* data, std::size_t size, bool last);
  Bytes compress(const Bytes& chunk, bool last) { return compress(chunk.data(), chunk.size(), last); }

  bool finished() const { return finished_; }
  uint64_t total_in() const { return total_in_; }
  uint64_t total_out() const { return total_out_; }

private:
  z_stream stream_;
  bool finished_ = false;
  uint64_t total_in_ = 0;
  uint64_t total_out_ = 0;
};

// Inverse of Compressor. Frames must arrive complete and in production order;
// decoding cannot restart from the middle of a stream.
class Decompressor {
public:
  Decompressor(const Decompressor&) = delete;
  Decompressor& operator=(const Decompressor&) = delete;

  Decompressor();
  ~Decompressor();

  // Throws CodecError on a malformed frame or on data past the end of stream
  Bytes decompress(const uint8_t* data, std::size_t size);
  Bytes decompress(const Bytes& frame) { return decompress(frame.data(), frame.size()); }

  bool finished() const { return finished_; }

private:
  z_stream stream_;
  bool finished_ = false;
  bool failed_ = false;
};

} // namespace codec
} // namespace rpipe

#endif // RPIPE_CODEC_STREAM_CODEC_HPP
