#ifndef K7_CRYPTO_ENCRYPTION_SERVICE_HPP
#define K7_CRYPTO_ENCRYPTION_SERVICE_HPP

#include <string>
#include "crypto/aes_cipher.hpp"

namespace k7::crypto {

// IV and ciphertext as carried inside an archive
struct SealedBlob {
  Bytes iv;
  Bytes ciphertext;

  // base64(iv || ciphertext)
  std::string to_base64() const;
  // Strict inverse of to_base64, throws CryptoError
  static SealedBlob from_base64(const std::string& text);
};

// Password-based AES-256-CBC sealing of opaque buffers. Holds no state, so
// one instance may be shared freely.
//
// The password is used directly as key material (zero padded or truncated to
// 32 bytes) and the ciphertext carries no authentication tag. Both are kept
// for compatibility with existing .k7 archives: a wrong password and a
// corrupted file are therefore indistinguishable (DecryptFailed, or garbage
// that fails later in the codec).
class EncryptionService {
public:
  SealedBlob seal(const Bytes& plaintext, const std::string& password) const;
  Bytes open(const SealedBlob& blob, const std::string& password) const;

  // Framed variants working on the base64 text representation
  std::string seal_to_base64(const Bytes& plaintext, const std::string& password) const;
  Bytes open_from_base64(const std::string& text, const std::string& password) const;

  static Bytes derive_key(const std::string& password);
};

} // namespace k7::crypto

#endif // K7_CRYPTO_ENCRYPTION_SERVICE_HPP
