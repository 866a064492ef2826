#include "crypto/aes_cipher.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace k7::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  // Initialize new cipher context
  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw CryptoError(CryptoErrorCode::CipherFailure, "Failed to create cipher context");
    }
  }

  // Free cipher context when object is destroyed
  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  // Access the underlying context
  EVP_CIPHER_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

AesCipher::AesCipher(const Bytes& key, const Bytes& iv)
  : key_(key)
  , iv_(iv)
  , context_(std::make_unique<CipherContext>()) {

  if (key_.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "AES cipher: Invalid key size: " << key_.size() << " bytes (expected " << KEY_SIZE << " bytes)";
    throw CryptoError(CryptoErrorCode::CipherFailure, "Invalid key size");
  }
  if (iv_.size() != IV_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "AES cipher: Invalid IV size: " << iv_.size() << " bytes (expected " << IV_SIZE << " bytes)";
    throw CryptoError(CryptoErrorCode::CipherFailure, "Invalid IV size");
  }
}

AesCipher::~AesCipher() {
  // Key material should not outlive the cipher
  OPENSSL_cleanse(key_.data(), key_.size());
}

//==============================================
// CIPHER INITIALIZATION
//==============================================

void AesCipher::initializeCipher(bool encrypting) {
  BOOST_LOG_TRIVIAL(debug) << "AES cipher: Initializing cipher for " << (encrypting ? "encryption" : "decryption");

  // Reset the context state
  EVP_CIPHER_CTX_reset(context_->get());

  const EVP_CIPHER* cipher = EVP_aes_256_cbc();
  if (encrypting) {
    if (!EVP_EncryptInit_ex(context_->get(), cipher, nullptr, key_.data(), iv_.data())) {
      throw CryptoError(CryptoErrorCode::CipherFailure, "Failed to initialize encryption context");
    }
  } else {
    if (!EVP_DecryptInit_ex(context_->get(), cipher, nullptr, key_.data(), iv_.data())) {
      throw CryptoError(CryptoErrorCode::CipherFailure, "Failed to initialize decryption context");
    }
  }
}

//==============================================
// BUFFER PROCESSING - ENCRYPTION/DECRYPTION
//==============================================

Bytes AesCipher::processBuffer(const Bytes& input, bool encrypting) {
  initializeCipher(encrypting);

  // Output never exceeds input plus one block of padding
  Bytes output(input.size() + BLOCK_SIZE);
  size_t written = 0;
  size_t block_count = 0;

  // Process the input in chunks
  for (size_t offset = 0; offset < input.size(); offset += BUFFER_SIZE) {
    size_t length = std::min(BUFFER_SIZE, input.size() - offset);
    written += processDataBlock(input.data() + offset, length, output.data() + written, encrypting);
    block_count++;
  }

  // Process final block with padding
  written += processFinalBlock(output.data() + written, encrypting);
  output.resize(written);

  BOOST_LOG_TRIVIAL(debug) << "AES cipher: Completed " << (encrypting ? "encryption" : "decryption")
                           << ": Processed " << input.size() << " bytes in " << block_count
                           << " chunks, produced " << written << " bytes";
  return output;
}

size_t AesCipher::processDataBlock(const uint8_t* inbuf, size_t length, uint8_t* outbuf,
                                   bool encrypting) {
  int outlen = 0;
  if (encrypting) {
    if (!EVP_EncryptUpdate(context_->get(), outbuf, &outlen, inbuf, static_cast<int>(length))) {
      throw CryptoError(CryptoErrorCode::CipherFailure, "Failed to encrypt data block");
    }
  } else {
    if (!EVP_DecryptUpdate(context_->get(), outbuf, &outlen, inbuf, static_cast<int>(length))) {
      throw CryptoError(CryptoErrorCode::DecryptFailed, "Failed to decrypt data block");
    }
  }
  return static_cast<size_t>(outlen);
}

size_t AesCipher::processFinalBlock(uint8_t* outbuf, bool encrypting) {
  int outlen = 0;
  if (encrypting) {
    if (!EVP_EncryptFinal_ex(context_->get(), outbuf, &outlen)) {
      throw CryptoError(CryptoErrorCode::CipherFailure, "Failed to finalize encryption");
    }
  } else {
    // Padding check fails here on a wrong key or corrupted ciphertext
    if (!EVP_DecryptFinal_ex(context_->get(), outbuf, &outlen)) {
      ERR_clear_error();
      throw CryptoError(CryptoErrorCode::DecryptFailed, "Failed to finalize decryption");
    }
  }
  return static_cast<size_t>(outlen);
}

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

Bytes AesCipher::encrypt(const Bytes& input) {
  return processBuffer(input, true);
}

Bytes AesCipher::decrypt(const Bytes& input) {
  return processBuffer(input, false);
}

//==============================================
// IV GENERATION
//==============================================

std::array<uint8_t, AesCipher::IV_SIZE> AesCipher::generate_IV() {
  std::array<uint8_t, IV_SIZE> iv;
  if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
    throw CryptoError(CryptoErrorCode::CipherFailure, "Failed to generate random IV");
  }
  return iv;
}

} // namespace k7::crypto
