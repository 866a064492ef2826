#ifndef K7_OPLOG_OPERATION_LOG_HPP
#define K7_OPLOG_OPERATION_LOG_HPP

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace k7 {
namespace oplog {

enum class Severity {
  Info,
  Warning,
  Error,
  Success,
  InfoImportant,
  InfoDetail
};

// "INFO", "WARNING", "ERROR", "SUCCESS", "INFO_IMPORTANT", "INFO_DETAIL"
const char* to_string(Severity severity);
std::optional<Severity> parse_severity(const std::string& name);

struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  Severity severity = Severity::Info;
  std::string message;

  // "[SEVERITY] YYYY-MM-DD HH:MM:SS - message" (UTC)
  std::string to_string() const;
};

// User-facing log of one export or import run. The owner clears it at the
// start of a run and persists it at the end; only the most recent persisted
// run is kept and it expires after the retention period.
//
// Not thread safe: one run owns the instance between clear() and
// persist_last().
class OperationLog {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  static constexpr std::chrono::seconds DEFAULT_RETENTION{3600};

  // ---- CONSTRUCTOR ----
  explicit OperationLog(std::filesystem::path persist_path,
                        std::chrono::seconds retention = DEFAULT_RETENTION,
                        Clock clock = Clock());


  // ---- CURRENT RUN ----
  void clear();
  void append(const std::string& message, Severity severity = Severity::Info);
  const std::vector<LogEntry>& entries() const { return entries_; }


  // ---- LAST RUN RETENTION ----
  // Replaces the persisted log with the current entries. Returns false (and
  // logs the cause) when the file cannot be written.
  bool persist_last() const;
  // Persisted entries, empty when nothing was persisted, it expired or the
  // file is unreadable
  std::vector<LogEntry> last_entries() const;
  // HTML list of escaped lines, empty string when there is nothing to show
  std::string formatted_last() const;

  const std::filesystem::path& persist_path() const { return persist_path_; }

  static std::string escape_html(const std::string& text);

private:
  // ---- PARAMETERS ----
  std::filesystem::path persist_path_;
  std::chrono::seconds retention_;
  Clock clock_;
  std::vector<LogEntry> entries_;
};

} // namespace oplog
} // namespace k7

#endif // K7_OPLOG_OPERATION_LOG_HPP
