#ifndef K7_CRYPTO_AES_CIPHER_HPP
#define K7_CRYPTO_AES_CIPHER_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <vector>
#include "crypto_error.hpp"

namespace k7::crypto {

using Bytes = std::vector<uint8_t>;

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// AES-256-CBC with PKCS#7 padding over in-memory buffers
class AesCipher {
public:

  static constexpr size_t KEY_SIZE = 32;     // 256 bits for AES-256
  static constexpr size_t IV_SIZE = 16;      // 128 bits for CBC mode
  static constexpr size_t BLOCK_SIZE = 16;   // AES block size

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  AesCipher(const Bytes& key, const Bytes& iv);
  ~AesCipher();

  AesCipher(const AesCipher&) = delete;
  AesCipher& operator=(const AesCipher&) = delete;

  // Generate a random initialization vector
  static std::array<uint8_t, IV_SIZE> generate_IV();


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  Bytes encrypt(const Bytes& input);
  Bytes decrypt(const Bytes& input);

private:
  // ---- PARAMETERS ----
  Bytes key_;
  Bytes iv_;
  std::unique_ptr<CipherContext> context_;
  static constexpr size_t BUFFER_SIZE = 8192;


  // ---- INITIALIZATION ----
  // Resets the cipher context for encryption or decryption
  void initializeCipher(bool encrypting);


  // ---- BUFFER PROCESSING - ENCRYPTION/DECRYPTION ----
  // Runs the whole input through the cipher in BUFFER_SIZE chunks
  Bytes processBuffer(const Bytes& input, bool encrypting);
  // Encrypts or decrypts a single chunk of data
  size_t processDataBlock(const uint8_t* inbuf, size_t length, uint8_t* outbuf,
                          bool encrypting);
  // Handles the final block with padding
  size_t processFinalBlock(uint8_t* outbuf, bool encrypting);
};

} // namespace k7::crypto

#endif // K7_CRYPTO_AES_CIPHER_HPP
