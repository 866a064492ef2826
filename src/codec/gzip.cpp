#include "codec/gzip.hpp"
#include <array>
#include <cstring>
#include <zlib.h>
#include <boost/log/trivial.hpp>

namespace k7 {
namespace codec {

namespace {

// windowBits 15 plus 16 selects the gzip wrapper in zlib
constexpr int GZIP_WINDOW_BITS = 15 + 16;
constexpr int MEM_LEVEL = 8;
constexpr size_t CHUNK_SIZE = 16384;

//=================================================
// RAII WRAPPERS TO MANAGE ZLIB STREAM LIFECYCLE
//=================================================

struct DeflateStream {
  z_stream strm{};

  explicit DeflateStream(int level) {
    if (deflateInit2(&strm, level, Z_DEFLATED, GZIP_WINDOW_BITS, MEM_LEVEL, Z_DEFAULT_STRATEGY) != Z_OK) {
      throw CodecError(CodecErrorCode::CompressFailed, "Failed to initialize deflate stream");
    }
  }

  ~DeflateStream() { deflateEnd(&strm); }

  z_stream* get() { return &strm; }
};

struct InflateStream {
  z_stream strm{};

  InflateStream() {
    if (inflateInit2(&strm, GZIP_WINDOW_BITS) != Z_OK) {
      throw CodecError(CodecErrorCode::DecompressFailed, "Failed to initialize inflate stream");
    }
  }

  ~InflateStream() { inflateEnd(&strm); }

  z_stream* get() { return &strm; }
};

} // namespace

//==============================================
// COMPRESSION
//==============================================

std::vector<uint8_t> gzip_compress(const std::string& data, int level) {
  if (level < Z_NO_COMPRESSION || level > Z_BEST_COMPRESSION) {
    throw CodecError(CodecErrorCode::CompressFailed, "Invalid compression level " + std::to_string(level));
  }

  DeflateStream stream(level);
  z_stream* z = stream.get();

  std::vector<uint8_t> out(deflateBound(z, static_cast<uLong>(data.size())));
  z->next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  z->avail_in = static_cast<uInt>(data.size());
  z->next_out = out.data();
  z->avail_out = static_cast<uInt>(out.size());

  // deflateBound guarantees a single Z_FINISH call completes the stream
  int rc = deflate(z, Z_FINISH);
  if (rc != Z_STREAM_END) {
    BOOST_LOG_TRIVIAL(error) << "Gzip: deflate failed with code " << rc;
    throw CodecError(CodecErrorCode::CompressFailed, "deflate returned " + std::to_string(rc));
  }

  out.resize(z->total_out);
  BOOST_LOG_TRIVIAL(debug) << "Gzip: Compressed " << data.size() << " bytes to " << out.size() << " bytes";
  return out;
}

//==============================================
// DECOMPRESSION
//==============================================

std::string gzip_decompress(const std::vector<uint8_t>& data, std::size_t max_output) {
  if (data.empty()) {
    throw CodecError(CodecErrorCode::DecompressFailed, "No compressed data");
  }

  InflateStream stream;
  z_stream* z = stream.get();
  z->next_in = const_cast<Bytef*>(data.data());
  z->avail_in = static_cast<uInt>(data.size());

  std::string out;
  std::array<uint8_t, CHUNK_SIZE> buffer;
  int rc = Z_OK;

  while (rc != Z_STREAM_END) {
    z->next_out = buffer.data();
    z->avail_out = static_cast<uInt>(buffer.size());

    rc = inflate(z, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      std::string reason = z->msg ? z->msg : ("inflate returned " + std::to_string(rc));
      BOOST_LOG_TRIVIAL(warning) << "Gzip: Inflate failed: " << reason;
      throw CodecError(CodecErrorCode::DecompressFailed, reason);
    }

    size_t produced = buffer.size() - z->avail_out;
    if (out.size() + produced > max_output) {
      BOOST_LOG_TRIVIAL(warning) << "Gzip: Decompressed size exceeds limit of " << max_output << " bytes";
      throw CodecError(CodecErrorCode::DecompressFailed, "Decompressed data exceeds size limit");
    }
    out.append(reinterpret_cast<const char*>(buffer.data()), produced);

    // Input exhausted before the end of the gzip member
    if (rc == Z_OK && z->avail_in == 0 && z->avail_out > 0) {
      throw CodecError(CodecErrorCode::DecompressFailed, "Truncated gzip stream");
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Gzip: Decompressed " << data.size() << " bytes to " << out.size() << " bytes";
  return out;
}

} // namespace codec
} // namespace k7
