#include "pipeline/export_run.hpp"
#include <ctime>
#include <boost/log/trivial.hpp>
#include "codec/archive_codec.hpp"

namespace k7 {
namespace pipeline {

using oplog::Severity;

ExportRun::ExportRun(store::RecordStore& store, oplog::OperationLog& log, ExportOptions options)
  : store_(store)
  , log_(log)
  , options_(std::move(options)) {}

//==============================================
// EXPORT
//==============================================

ExportResult ExportRun::run(const std::string& password) {
  log_.clear();
  log_.append("Record export process initiated.", Severity::Info);

  if (password.empty()) {
    record_failure("Encryption password is not set, cannot create K7 file.");
    throw crypto::CryptoError(crypto::CryptoErrorCode::MissingPassword, "Encryption password is not set");
  }

  record::RecordList records;
  try {
    for (auto& stored : store_.list()) {
      if (!stored.record.credential_hash) {
        log_.append("Record \"" + stored.record.key + "\" has no credential hash and will be skipped on import.",
                    Severity::Warning);
      }
      records.push_back(std::move(stored.record));
    }
  }
  catch (const store::StoreError& e) {
    record_failure(std::string("Failed to read records from the store: ") + e.what());
    throw;
  }

  if (records.empty()) {
    log_.append("No records found to export.", Severity::Warning);
  } else {
    log_.append("Found " + std::to_string(records.size()) + " records to export.", Severity::Info);
  }

  ExportResult result;
  try {
    codec::ArchiveCodec codec(&log_);
    result.archive = codec.seal(records, password);
  }
  catch (const crypto::CryptoError& e) {
    record_failure(std::string("Failed to create K7 file: ") + e.what());
    throw;
  }
  catch (const codec::CodecError& e) {
    record_failure(std::string("Failed to create K7 file: ") + e.what());
    throw;
  }

  auto now = options_.clock ? options_.clock() : std::chrono::system_clock::now();
  result.filename = make_filename(options_.filename_prefix, now);
  result.record_count = records.size();

  log_.append("K7 export complete. " + std::to_string(result.record_count) + " records exported to "
              + result.filename + ".", Severity::Success);
  if (!log_.persist_last()) {
    BOOST_LOG_TRIVIAL(warning) << "ExportRun: Run log could not be persisted";
  }

  BOOST_LOG_TRIVIAL(info) << "ExportRun: Exported " << result.record_count << " records as " << result.filename;
  return result;
}

std::string ExportRun::make_filename(const std::string& prefix, std::chrono::system_clock::time_point when) {
  std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm tm{};
  gmtime_r(&t, &tm);

  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm);
  return prefix + "_" + stamp + ARCHIVE_EXTENSION;
}

void ExportRun::record_failure(const std::string& message) {
  BOOST_LOG_TRIVIAL(error) << "ExportRun: " << message;
  log_.append(message, Severity::Error);
  if (!log_.persist_last()) {
    BOOST_LOG_TRIVIAL(warning) << "ExportRun: Run log could not be persisted";
  }
}

} // namespace pipeline
} // namespace k7
