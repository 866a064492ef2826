#ifndef K7_PIPELINE_IMPORT_RUN_HPP
#define K7_PIPELINE_IMPORT_RUN_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "codec/archive_codec.hpp"
#include "oplog/operation_log.hpp"
#include "pipeline/pipeline_error.hpp"
#include "reconcile/reconciler.hpp"
#include "store/record_store.hpp"

namespace k7 {
namespace pipeline {

// Largest archive accepted for import
constexpr size_t DEFAULT_MAX_ARCHIVE_BYTES = 5 * 1024 * 1024;

struct ImportRequest {
  std::string archive;
  std::string password;
  bool dry_run = false;
  // Name of the uploaded file, checked for the .k7 extension when present
  std::optional<std::string> filename;
};

struct ImportResult {
  reconcile::Summary summary;
  std::vector<reconcile::Decision> decisions;
  // Final summary line, also the last log entry
  std::string message;
  std::vector<oplog::LogEntry> log;
};

struct ImportOptions {
  size_t max_archive_bytes = DEFAULT_MAX_ARCHIVE_BYTES;
  size_t max_inflated_bytes = codec::DEFAULT_MAX_INFLATED_BYTES;
  reconcile::ReconcilerOptions reconciler;
};

// Validates an uploaded archive, opens it and reconciles its records with the
// store. Gate, decryption, decompression and parse failures abort the run
// before any record is touched: they are logged, the log is persisted and the
// error (CryptoError, CodecError, PipelineError) is rethrown. Per-record
// problems only show up in the decisions.
class ImportRun {
public:
  ImportRun(store::RecordStore& store, oplog::OperationLog& log, ImportOptions options = ImportOptions());

  ImportResult run(const ImportRequest& request);

private:
  store::RecordStore& store_;
  oplog::OperationLog& log_;
  ImportOptions options_;

  void validate(const ImportRequest& request);
  // Logs the failure and persists the log; the caller throws
  void record_failure(const std::string& message);
};

} // namespace pipeline
} // namespace k7

#endif // K7_PIPELINE_IMPORT_RUN_HPP
