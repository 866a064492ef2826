#include "pipeline/import_run.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <boost/log/trivial.hpp>
#include "pipeline/export_run.hpp"

namespace k7 {
namespace pipeline {

using oplog::Severity;

namespace {

std::string lower_extension(const std::string& filename) {
  std::string ext = std::filesystem::path(filename).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

} // namespace

ImportRun::ImportRun(store::RecordStore& store, oplog::OperationLog& log, ImportOptions options)
  : store_(store)
  , log_(log)
  , options_(std::move(options)) {}

//==============================================
// IMPORT
//==============================================

ImportResult ImportRun::run(const ImportRequest& request) {
  log_.clear();
  log_.append("Record import process initiated.", Severity::Info);

  validate(request);

  if (request.dry_run) {
    log_.append("--- DRY RUN MODE ACTIVATED ---", Severity::InfoImportant);
  }

  record::RecordList records;
  try {
    codec::ArchiveCodec codec(&log_, options_.max_inflated_bytes);
    records = codec.open(request.archive, request.password);
  }
  catch (const crypto::CryptoError& e) {
    record_failure(std::string("Failed to decrypt K7 file. Incorrect password or corrupted file? ") + e.what());
    throw;
  }
  catch (const codec::CodecError& e) {
    if (e.code() == codec::CodecErrorCode::DecompressFailed) {
      record_failure(std::string("Failed to decompress K7 file data after decryption: ") + e.what());
    } else {
      record_failure(std::string("Failed to parse record data from K7 file: ") + e.what());
    }
    throw;
  }

  if (records.empty()) {
    log_.append("Archive contains no record entries.", Severity::Warning);
  }

  reconcile::Reconciler reconciler(store_, log_, options_.reconciler);
  reconcile::ReconcileResult reconciled = reconciler.apply(records, request.dry_run);

  ImportResult result;
  result.summary = reconciled.summary;
  result.decisions = std::move(reconciled.decisions);
  result.message = "K7 Import Complete. Records Created: " + std::to_string(result.summary.created)
                 + ", Records Updated: " + std::to_string(result.summary.updated)
                 + ", Entries Skipped/Errored: " + std::to_string(result.summary.skipped) + ".";
  if (request.dry_run) {
    result.message = "DRY RUN COMPLETED. " + result.message + " No actual changes were made.";
  }

  log_.append(result.message, Severity::Success);
  if (!log_.persist_last()) {
    BOOST_LOG_TRIVIAL(warning) << "ImportRun: Run log could not be persisted";
  }
  result.log = log_.entries();

  BOOST_LOG_TRIVIAL(info) << "ImportRun: " << result.message;
  return result;
}

//==============================================
// VALIDATION GATE
//==============================================

void ImportRun::validate(const ImportRequest& request) {
  if (request.password.empty()) {
    record_failure("Encryption password not set, cannot decrypt K7 file.");
    throw crypto::CryptoError(crypto::CryptoErrorCode::MissingPassword, "Encryption password is not set");
  }

  if (request.filename) {
    std::string ext = lower_extension(*request.filename);
    if (ext != ARCHIVE_EXTENSION) {
      record_failure("Invalid file type uploaded: " + (ext.empty() ? std::string("(none)") : ext) + ". Expected .k7");
      throw PipelineError(PipelineErrorCode::InvalidFileType, "Expected a .k7 file, got " + *request.filename);
    }
  }

  if (request.archive.size() > options_.max_archive_bytes) {
    record_failure("Uploaded file is too large: " + std::to_string(request.archive.size()) + " bytes. Max: "
                   + std::to_string(options_.max_archive_bytes) + " bytes.");
    throw PipelineError(PipelineErrorCode::ArchiveTooLarge,
                        std::to_string(request.archive.size()) + " bytes exceeds the limit of "
                        + std::to_string(options_.max_archive_bytes));
  }

  if (request.archive.empty()) {
    record_failure("Could not read uploaded K7 file or file is empty.");
    throw PipelineError(PipelineErrorCode::EmptyArchive, "Archive is empty");
  }

  log_.append("K7 file \"" + request.filename.value_or("archive") + "\" received for import.", Severity::Info);
}

void ImportRun::record_failure(const std::string& message) {
  BOOST_LOG_TRIVIAL(error) << "ImportRun: " << message;
  log_.append(message, Severity::Error);
  if (!log_.persist_last()) {
    BOOST_LOG_TRIVIAL(warning) << "ImportRun: Run log could not be persisted";
  }
}

} // namespace pipeline
} // namespace k7
