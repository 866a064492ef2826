#ifndef K7_CODEC_ARCHIVE_CODEC_HPP
#define K7_CODEC_ARCHIVE_CODEC_HPP

#include <cstddef>
#include <string>
#include "codec/codec_error.hpp"
#include "crypto/encryption_service.hpp"
#include "oplog/operation_log.hpp"
#include "record/record.hpp"

namespace k7 {
namespace codec {

// Upper bound on the inflated JSON payload of one archive
constexpr std::size_t DEFAULT_MAX_INFLATED_BYTES = 256 * 1024 * 1024;

// Export/import transform of a record list:
//   seal: records -> JSON array -> gzip -> AES-256-CBC -> base64
//   open: the reverse, failing at the first stage that rejects the input
//
// When a log is given, every completed stage appends one entry to it.
class ArchiveCodec {
public:
  // ---- CONSTRUCTOR ----
  explicit ArchiveCodec(oplog::OperationLog* log = nullptr,
                        std::size_t max_inflated_bytes = DEFAULT_MAX_INFLATED_BYTES);


  // ---- TRANSFORMS ----
  // Throws CodecError (SerializeFailed, CompressFailed, EncryptFailed) or
  // CryptoError(MissingPassword)
  std::string seal(const record::RecordList& records, const std::string& password) const;
  // CryptoError from the decryption stage propagates unchanged; later stages
  // throw CodecError (DecompressFailed, ParseFailed)
  record::RecordList open(const std::string& archive, const std::string& password) const;

private:
  // ---- PARAMETERS ----
  crypto::EncryptionService encryption_;
  oplog::OperationLog* log_;
  std::size_t max_inflated_bytes_;


  // ---- STAGES ----
  std::string serialize(const record::RecordList& records) const;
  record::RecordList parse(const std::string& json) const;
  void report(const std::string& message) const;
};

} // namespace codec
} // namespace k7

#endif // K7_CODEC_ARCHIVE_CODEC_HPP
