#include "codec/archive_codec.hpp"
#include <memory>
#include <json/json.h>
#include <boost/log/trivial.hpp>
#include "codec/gzip.hpp"
#include "record/record_json.hpp"

namespace k7 {
namespace codec {

//==============================================
// CONSTRUCTOR
//==============================================

ArchiveCodec::ArchiveCodec(oplog::OperationLog* log, std::size_t max_inflated_bytes)
  : log_(log)
  , max_inflated_bytes_(max_inflated_bytes) {}


//==============================================
// TRANSFORMS
//==============================================

std::string ArchiveCodec::seal(const record::RecordList& records, const std::string& password) const {
  BOOST_LOG_TRIVIAL(info) << "ArchiveCodec: Sealing " << records.size() << " records";

  if (password.empty()) {
    throw crypto::CryptoError(crypto::CryptoErrorCode::MissingPassword, "Encryption password is not set");
  }

  std::string json = serialize(records);
  report("Record data successfully encoded to JSON.");

  std::vector<uint8_t> compressed = gzip_compress(json, GZIP_MAX_LEVEL);
  report("JSON data successfully compressed.");

  std::string archive;
  try {
    archive = encryption_.seal_to_base64(compressed, password);
  }
  catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "ArchiveCodec: Encryption stage failed: " << e.what();
    throw CodecError(CodecErrorCode::EncryptFailed, e.what());
  }
  report("Compressed data successfully encrypted.");

  BOOST_LOG_TRIVIAL(info) << "ArchiveCodec: Sealed archive of " << archive.size() << " bytes";
  return archive;
}

record::RecordList ArchiveCodec::open(const std::string& archive, const std::string& password) const {
  BOOST_LOG_TRIVIAL(info) << "ArchiveCodec: Opening archive of " << archive.size() << " bytes";

  crypto::Bytes compressed = encryption_.open_from_base64(archive, password);
  report("Archive data successfully decrypted.");

  std::string json = gzip_decompress(compressed, max_inflated_bytes_);
  report("Decrypted data successfully decompressed.");

  record::RecordList records = parse(json);
  report("Successfully parsed archive, found " + std::to_string(records.size()) + " record entries.");
  return records;
}


//==============================================
// STAGES
//==============================================

std::string ArchiveCodec::serialize(const record::RecordList& records) const {
  try {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "    ";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, record::to_json(records));
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "ArchiveCodec: JSON encoding failed: " << e.what();
    throw CodecError(CodecErrorCode::SerializeFailed, e.what());
  }
}

record::RecordList ArchiveCodec::parse(const std::string& json) const {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["failIfExtra"] = true;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string errors;
  bool parsed = false;
  try {
    parsed = reader->parse(json.data(), json.data() + json.size(), &root, &errors);
  }
  catch (const Json::Exception& e) {
    // Thrown instead of reported, e.g. when nesting exceeds the reader's stack limit
    errors = e.what();
  }
  if (!parsed) {
    BOOST_LOG_TRIVIAL(warning) << "ArchiveCodec: Payload is not valid JSON: " << errors;
    throw CodecError(CodecErrorCode::ParseFailed, "Invalid JSON: " + errors);
  }
  if (!root.isArray()) {
    BOOST_LOG_TRIVIAL(warning) << "ArchiveCodec: Payload is not a JSON array";
    throw CodecError(CodecErrorCode::ParseFailed, "Top-level value is not a list of records");
  }

  record::RecordList records;
  records.reserve(root.size());
  for (const auto& element : root) {
    records.push_back(record::from_json(element));
  }
  return records;
}

void ArchiveCodec::report(const std::string& message) const {
  if (log_) {
    log_->append(message, oplog::Severity::Info);
  }
}

} // namespace codec
} // namespace k7
