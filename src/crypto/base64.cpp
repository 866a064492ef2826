#include "crypto/base64.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace k7::crypto {

namespace {

bool is_base64_char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '+' || c == '/';
}

void reject(const std::string& reason) {
  BOOST_LOG_TRIVIAL(warning) << "Base64: Rejected input: " << reason;
  throw CryptoError(CryptoErrorCode::MalformedEncoding, reason);
}

} // namespace

std::string base64_encode(const Bytes& data) {
  if (data.empty()) {
    return {};
  }

  // EVP_EncodeBlock writes 4 bytes per 3-byte group plus a NUL terminator
  std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                data.data(), static_cast<int>(data.size()));
  out.resize(static_cast<size_t>(written));
  return out;
}

Bytes base64_decode(const std::string& text) {
  size_t length = text.size();
  while (length > 0 && (text[length - 1] == '\n' || text[length - 1] == '\r')) {
    --length;
  }

  if (length == 0) {
    reject("empty input");
  }
  if (length % 4 != 0) {
    reject("length is not a multiple of 4");
  }

  // Padding may only appear as the last one or two characters
  size_t padding = 0;
  if (text[length - 1] == '=') {
    padding = (text[length - 2] == '=') ? 2 : 1;
  }

  for (size_t i = 0; i < length - padding; ++i) {
    if (!is_base64_char(text[i])) {
      reject("invalid character at offset " + std::to_string(i));
    }
  }

  Bytes out(3 * (length / 4));
  int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                static_cast<int>(length));
  if (written < 0) {
    reject("decoder failure");
  }

  // EVP_DecodeBlock counts the padding positions as output bytes
  out.resize(static_cast<size_t>(written) - padding);
  return out;
}

} // namespace k7::crypto
