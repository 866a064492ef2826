#include "crypto/encryption_service.hpp"
#include "crypto/base64.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace k7::crypto {

//==============================================
// SEALED BLOB FRAMING
//==============================================

std::string SealedBlob::to_base64() const {
  Bytes framed;
  framed.reserve(iv.size() + ciphertext.size());
  framed.insert(framed.end(), iv.begin(), iv.end());
  framed.insert(framed.end(), ciphertext.begin(), ciphertext.end());
  return base64_encode(framed);
}

SealedBlob SealedBlob::from_base64(const std::string& text) {
  Bytes framed = base64_decode(text);

  // At least a full IV and one cipher block are required
  if (framed.size() < AesCipher::IV_SIZE + AesCipher::BLOCK_SIZE) {
    BOOST_LOG_TRIVIAL(warning) << "Encryption service: Sealed blob too short: " << framed.size() << " bytes";
    throw CryptoError(CryptoErrorCode::Truncated,
                      "Sealed blob holds " + std::to_string(framed.size()) + " bytes");
  }

  SealedBlob blob;
  blob.iv.assign(framed.begin(), framed.begin() + AesCipher::IV_SIZE);
  blob.ciphertext.assign(framed.begin() + AesCipher::IV_SIZE, framed.end());
  return blob;
}

//==============================================
// KEY MATERIAL
//==============================================

Bytes EncryptionService::derive_key(const std::string& password) {
  Bytes key(AesCipher::KEY_SIZE, 0);
  std::copy_n(password.begin(), std::min(password.size(), AesCipher::KEY_SIZE), key.begin());
  return key;
}

//==============================================
// SEAL / OPEN
//==============================================

SealedBlob EncryptionService::seal(const Bytes& plaintext, const std::string& password) const {
  if (password.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Encryption service: Refusing to seal without a password";
    throw CryptoError(CryptoErrorCode::MissingPassword, "Encryption password is not set");
  }

  auto iv = AesCipher::generate_IV();
  SealedBlob blob;
  blob.iv.assign(iv.begin(), iv.end());

  AesCipher cipher(derive_key(password), blob.iv);
  blob.ciphertext = cipher.encrypt(plaintext);

  BOOST_LOG_TRIVIAL(debug) << "Encryption service: Sealed " << plaintext.size()
                           << " bytes into " << blob.ciphertext.size() << " bytes of ciphertext";
  return blob;
}

Bytes EncryptionService::open(const SealedBlob& blob, const std::string& password) const {
  if (password.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Encryption service: Refusing to open without a password";
    throw CryptoError(CryptoErrorCode::MissingPassword, "Encryption password is not set");
  }
  if (blob.iv.size() != AesCipher::IV_SIZE) {
    throw CryptoError(CryptoErrorCode::Truncated, "IV must be " + std::to_string(AesCipher::IV_SIZE) + " bytes");
  }
  if (blob.ciphertext.empty()) {
    throw CryptoError(CryptoErrorCode::Truncated, "Ciphertext is empty");
  }
  if (blob.ciphertext.size() % AesCipher::BLOCK_SIZE != 0) {
    BOOST_LOG_TRIVIAL(warning) << "Encryption service: Ciphertext length " << blob.ciphertext.size()
                               << " is not a multiple of the block size";
    throw CryptoError(CryptoErrorCode::DecryptFailed, "Ciphertext is not block aligned");
  }

  AesCipher cipher(derive_key(password), blob.iv);
  try {
    return cipher.decrypt(blob.ciphertext);
  }
  catch (const CryptoError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Encryption service: Decryption failed (wrong password or corrupted data): " << e.what();
    throw;
  }
}

std::string EncryptionService::seal_to_base64(const Bytes& plaintext, const std::string& password) const {
  return seal(plaintext, password).to_base64();
}

Bytes EncryptionService::open_from_base64(const std::string& text, const std::string& password) const {
  if (password.empty()) {
    throw CryptoError(CryptoErrorCode::MissingPassword, "Encryption password is not set");
  }
  return open(SealedBlob::from_base64(text), password);
}

} // namespace k7::crypto
