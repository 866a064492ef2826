#ifndef K7_CRYPTO_BASE64_HPP
#define K7_CRYPTO_BASE64_HPP

#include <string>
#include "crypto/aes_cipher.hpp"

namespace k7::crypto {

// Standard alphabet, padded, no line breaks
std::string base64_encode(const Bytes& data);

// Strict decode: rejects characters outside the alphabet, misplaced or
// missing padding, and lengths that are not a multiple of four. Trailing
// CR/LF line terminators are ignored. Throws CryptoError(MalformedEncoding).
Bytes base64_decode(const std::string& text);

} // namespace k7::crypto

#endif // K7_CRYPTO_BASE64_HPP
