#ifndef K7_PIPELINE_EXPORT_RUN_HPP
#define K7_PIPELINE_EXPORT_RUN_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include "oplog/operation_log.hpp"
#include "store/record_store.hpp"

namespace k7 {
namespace pipeline {

constexpr const char* DEFAULT_FILENAME_PREFIX = "Usersk7";
constexpr const char* ARCHIVE_EXTENSION = ".k7";

struct ExportOptions {
  std::string filename_prefix = DEFAULT_FILENAME_PREFIX;
  // Time used for the suggested filename, system clock when empty
  std::function<std::chrono::system_clock::time_point()> clock;
};

struct ExportResult {
  std::string archive;
  // "<prefix>_YYYYMMDD_HHMMSS.k7"
  std::string filename;
  size_t record_count = 0;
};

// Seals every record of the store into one archive. The run clears the log
// when it starts and persists it when it ends, whether it succeeds or not.
// Failures are logged and rethrown (CryptoError, CodecError, StoreError).
class ExportRun {
public:
  ExportRun(store::RecordStore& store, oplog::OperationLog& log, ExportOptions options = ExportOptions());

  ExportResult run(const std::string& password);

  static std::string make_filename(const std::string& prefix, std::chrono::system_clock::time_point when);

private:
  store::RecordStore& store_;
  oplog::OperationLog& log_;
  ExportOptions options_;

  // Logs the failure and persists the log; the caller throws
  void record_failure(const std::string& message);
};

} // namespace pipeline
} // namespace k7

#endif // K7_PIPELINE_EXPORT_RUN_HPP
