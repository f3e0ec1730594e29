#include "codec/stream_codec.hpp"
#include <boost/log/trivial.hpp>
#include <climits>
#include <cstring>

namespace rpipe {
namespace codec {

namespace {

std::string zlib_message(const z_stream& stream, int ret) {
  if (stream.msg) {
    return std::string(stream.msg);
  }
  return "zlib error code " + std::to_string(ret);
}

} // namespace

//==============================================
// COMPRESSOR
//==============================================

Compressor::Compressor(int level) {
  std::memset(&stream_, 0, sizeof(z_stream));
  stream_.zalloc = Z_NULL;
  stream_.zfree = Z_NULL;
  stream_.opaque = Z_NULL;

  if (deflateInit2(&stream_, level, Z_DEFLATED, 15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
    throw CodecError("Failed to initialize compressor");
  }
  BOOST_LOG_TRIVIAL(debug) << "Codec: Compressor initialized with level " << level;
}

Compressor::~Compressor() {
  deflateEnd(&stream_);
}

Bytes Compressor::compress(const uint8_t* data, std::size_t size, bool last) {
  if (finished_) {
    throw CodecError("Compressor already finished");
  }
  if (size > UINT_MAX) {
    throw CodecError("Chunk too large for compressor");
  }

  stream_.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
  stream_.avail_in = static_cast<uInt>(size);

  const int flush = last ? Z_FINISH : Z_SYNC_FLUSH;
  Bytes frame;
  std::size_t offset = 0;
  int ret = Z_OK;

  do {
    frame.resize(offset + kCodecBufferSize);
    stream_.next_out = reinterpret_cast<Bytef*>(frame.data() + offset);
    stream_.avail_out = static_cast<uInt>(kCodecBufferSize);

    ret = deflate(&stream_, flush);
    if (ret == Z_STREAM_ERROR) {
      throw CodecError("Compression failed: " + zlib_message(stream_, ret));
    }
    offset += kCodecBufferSize - stream_.avail_out;
  } while (stream_.avail_out == 0 || (last && ret != Z_STREAM_END));

  frame.resize(offset);
  finished_ = last;
  total_in_ += size;
  total_out_ += frame.size();

  BOOST_LOG_TRIVIAL(trace) << "Codec: Compressed " << size << " bytes into frame of "
                           << frame.size() << " bytes" << (last ? " (final)" : "");
  return frame;
}

//==============================================
// DECOMPRESSOR
//==============================================

Decompressor::Decompressor() {
  std::memset(&stream_, 0, sizeof(z_stream));
  stream_.zalloc = Z_NULL;
  stream_.zfree = Z_NULL;
  stream_.opaque = Z_NULL;
  stream_.next_in = Z_NULL;
  stream_.avail_in = 0;

  if (inflateInit2(&stream_, 15) != Z_OK) {
    throw CodecError("Failed to initialize decompressor");
  }
}

Decompressor::~Decompressor() {
  inflateEnd(&stream_);
}

Bytes Decompressor::decompress(const uint8_t* data, std::size_t size) {
  if (failed_) {
    throw CodecError("Decompressor is unusable after an earlier malformed frame");
  }
  if (finished_) {
    if (size > 0) {
      throw CodecError("Data after end of compressed stream");
    }
    return {};
  }
  if (size > UINT_MAX) {
    throw CodecError("Frame too large for decompressor");
  }

  stream_.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
  stream_.avail_in = static_cast<uInt>(size);

  Bytes output;
  std::size_t offset = 0;

  do {
    output.resize(offset + kCodecBufferSize);
    stream_.next_out = reinterpret_cast<Bytef*>(output.data() + offset);
    stream_.avail_out = static_cast<uInt>(kCodecBufferSize);

    const int ret = inflate(&stream_, Z_SYNC_FLUSH);
    switch (ret) {
      case Z_OK:
      case Z_BUF_ERROR:
        break;
      case Z_STREAM_END:
        finished_ = true;
        break;
      default:
        failed_ = true;
        BOOST_LOG_TRIVIAL(error) << "Codec: Malformed frame: " << zlib_message(stream_, ret);
        throw CodecError("Malformed frame: " + zlib_message(stream_, ret));
    }
    offset += kCodecBufferSize - stream_.avail_out;

    // No progress possible until the next frame arrives
    if (ret == Z_BUF_ERROR && stream_.avail_out != 0) {
      break;
    }
  } while (!finished_ && (stream_.avail_in > 0 || stream_.avail_out == 0));

  output.resize(offset);

  if (finished_ && stream_.avail_in > 0) {
    failed_ = true;
    throw CodecError("Trailing data after end of compressed stream");
  }

  BOOST_LOG_TRIVIAL(trace) << "Codec: Decompressed frame of " << size << " bytes into "
                           << output.size() << " bytes" << (finished_ ? " (final)" : "");
  return output;
}

} // namespace codec
} // namespace rpipe
