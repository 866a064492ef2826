#ifndef K7_CODEC_GZIP_HPP
#define K7_CODEC_GZIP_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "codec/codec_error.hpp"

namespace k7 {
namespace codec {

constexpr int GZIP_MAX_LEVEL = 9;

// gzip member (RFC 1952) of the given text, throws CodecError(CompressFailed)
std::vector<uint8_t> gzip_compress(const std::string& data, int level = GZIP_MAX_LEVEL);

// Inflates one gzip member. Bad magic, a corrupt stream, a truncated stream
// or output beyond max_output bytes throw CodecError(DecompressFailed).
std::string gzip_decompress(const std::vector<uint8_t>& data, std::size_t max_output);

} // namespace codec
} // namespace k7

#endif // K7_CODEC_GZIP_HPP
