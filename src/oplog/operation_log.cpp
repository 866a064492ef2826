#include "oplog/operation_log.hpp"
#include <fstream>
#include <sstream>
#include <json/json.h>
#include <boost/log/trivial.hpp>
#include "record/sanitize.hpp"

namespace k7 {
namespace oplog {

namespace {

using std::chrono::system_clock;

int64_t to_millis(system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

system_clock::time_point from_millis(int64_t millis) {
  return system_clock::time_point(std::chrono::duration_cast<system_clock::duration>(
      std::chrono::milliseconds(millis)));
}

// Mirrors run entries into the process log
void mirror(const LogEntry& entry) {
  switch (entry.severity) {
    case Severity::Error:
      BOOST_LOG_TRIVIAL(error) << "Operation log: " << entry.message;
      break;
    case Severity::Warning:
      BOOST_LOG_TRIVIAL(warning) << "Operation log: " << entry.message;
      break;
    case Severity::InfoDetail:
      BOOST_LOG_TRIVIAL(debug) << "Operation log: " << entry.message;
      break;
    default:
      BOOST_LOG_TRIVIAL(info) << "Operation log: [" << to_string(entry.severity) << "] " << entry.message;
      break;
  }
}

} // namespace

//==============================================
// SEVERITY AND ENTRY FORMATTING
//==============================================

const char* to_string(Severity severity) {
  switch (severity) {
    case Severity::Info:          return "INFO";
    case Severity::Warning:       return "WARNING";
    case Severity::Error:         return "ERROR";
    case Severity::Success:       return "SUCCESS";
    case Severity::InfoImportant: return "INFO_IMPORTANT";
    case Severity::InfoDetail:    return "INFO_DETAIL";
    default:                      return "UNKNOWN";
  }
}

std::optional<Severity> parse_severity(const std::string& name) {
  for (Severity s : {Severity::Info, Severity::Warning, Severity::Error,
                     Severity::Success, Severity::InfoImportant, Severity::InfoDetail}) {
    if (name == to_string(s)) {
      return s;
    }
  }
  return std::nullopt;
}

std::string LogEntry::to_string() const {
  std::ostringstream out;
  out << "[" << oplog::to_string(severity) << "] " << record::format_utc(timestamp) << " - " << message;
  return out.str();
}

//==============================================
// CONSTRUCTOR
//==============================================

OperationLog::OperationLog(std::filesystem::path persist_path, std::chrono::seconds retention, Clock clock)
  : persist_path_(std::move(persist_path))
  , retention_(retention)
  , clock_(clock ? std::move(clock) : Clock([] { return system_clock::now(); })) {}

//==============================================
// CURRENT RUN
//==============================================

void OperationLog::clear() {
  entries_.clear();
}

void OperationLog::append(const std::string& message, Severity severity) {
  entries_.push_back(LogEntry{clock_(), severity, message});
  mirror(entries_.back());
}

//==============================================
// LAST RUN RETENTION
//==============================================

bool OperationLog::persist_last() const {
  Json::Value root(Json::objectValue);
  auto now = clock_();
  root["saved_at"] = Json::Int64(to_millis(now));
  root["expires_at"] = Json::Int64(to_millis(now + retention_));

  Json::Value entries(Json::arrayValue);
  for (const auto& entry : entries_) {
    Json::Value item(Json::objectValue);
    item["timestamp"] = Json::Int64(to_millis(entry.timestamp));
    item["severity"] = to_string(entry.severity);
    item["message"] = entry.message;
    entries.append(item);
  }
  root["entries"] = entries;

  try {
    if (persist_path_.has_parent_path()) {
      std::filesystem::create_directories(persist_path_.parent_path());
    }

    // Write beside the target and rename so readers never see a partial file
    std::filesystem::path tmp_path = persist_path_;
    tmp_path += ".tmp";
    {
      std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
      if (!file) {
        BOOST_LOG_TRIVIAL(error) << "Operation log: Failed to open " << tmp_path.string() << " for writing";
        return false;
      }
      Json::StreamWriterBuilder builder;
      builder["indentation"] = "";
      file << Json::writeString(builder, root);
      if (!file.good()) {
        BOOST_LOG_TRIVIAL(error) << "Operation log: Failed to write " << tmp_path.string();
        return false;
      }
    }
    std::filesystem::rename(tmp_path, persist_path_);
  }
  catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Operation log: Failed to persist last run log: " << e.what();
    return false;
  }

  BOOST_LOG_TRIVIAL(debug) << "Operation log: Persisted " << entries_.size() << " entries to " << persist_path_.string();
  return true;
}

std::vector<LogEntry> OperationLog::last_entries() const {
  std::vector<LogEntry> entries;

  std::ifstream file(persist_path_, std::ios::binary);
  if (!file) {
    return entries;
  }

  Json::Value root;
  Json::CharReaderBuilder builder;
  std::string errors;
  bool parsed = false;
  try {
    parsed = Json::parseFromStream(builder, file, &root, &errors);
  }
  catch (const Json::Exception& e) {
    errors = e.what();
  }
  if (!parsed || !root.isObject()) {
    BOOST_LOG_TRIVIAL(warning) << "Operation log: Ignoring unreadable persisted log: " << errors;
    return entries;
  }

  const Json::Value& expires_at = root["expires_at"];
  if (!expires_at.isInt64() || expires_at.asInt64() <= to_millis(clock_())) {
    BOOST_LOG_TRIVIAL(debug) << "Operation log: Persisted log expired";
    return entries;
  }

  for (const auto& item : root["entries"]) {
    std::optional<Severity> severity;
    if (item.isObject() && item["severity"].isString()) {
      severity = parse_severity(item["severity"].asString());
    }
    if (!severity || !item["timestamp"].isIntegral() || !item["message"].isString()) {
      BOOST_LOG_TRIVIAL(warning) << "Operation log: Ignoring unreadable persisted log";
      return {};
    }
    entries.push_back(LogEntry{from_millis(item["timestamp"].asInt64()), *severity, item["message"].asString()});
  }
  return entries;
}

std::string OperationLog::formatted_last() const {
  auto entries = last_entries();
  if (entries.empty()) {
    return {};
  }

  std::ostringstream out;
  out << "<ul style=\"list-style: none; padding-left: 0;\">";
  for (const auto& entry : entries) {
    out << "<li>" << escape_html(entry.to_string()) << "</li>";
  }
  out << "</ul>";
  return out.str();
}

std::string OperationLog::escape_html(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':  out += "&amp;"; break;
      case '<':  out += "&lt;"; break;
      case '>':  out += "&gt;"; break;
      case '"':  out += "&quot;"; break;
      case '\'': out += "&#039;"; break;
      default:   out.push_back(c); break;
    }
  }
  return out;
}

} // namespace oplog
} // namespace k7
