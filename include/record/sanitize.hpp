#ifndef K7_RECORD_SANITIZE_HPP
#define K7_RECORD_SANITIZE_HPP

#include <chrono>
#include <string>
#include "record/record.hpp"

namespace k7 {
namespace record {

// ---- FIELD SANITIZERS ----
// Login-like key: markup removed, only [a-z0-9 _.-@] kept, whitespace
// collapsed and trimmed, lower-cased. May return an empty string.
std::string normalize_key(const std::string& raw);

// Returns an empty string when the address cannot be made valid
std::string sanitize_email(const std::string& raw);

// Keeps http, https, ftp, ftps and mailto URLs. Scheme-less values get
// "http://" prepended; anything else is dropped.
std::string sanitize_url(const std::string& raw);

// Lower-case slug of [a-z0-9_-]
std::string sanitize_slug(const std::string& raw);

// Single-line text: markup stripped, line breaks and tabs folded to spaces
std::string sanitize_text(const std::string& raw);

// Multi-line text: markup stripped, line breaks kept
std::string sanitize_textarea(const std::string& raw);

// "YYYY-MM-DD HH:MM:SS" in UTC
std::string format_utc(std::chrono::system_clock::time_point when);


// ---- STORE REQUESTS ----
// Builds the record handed to RecordStore::create/update: sanitized known
// fields with defaults filled, extra fields and metadata left out.
Record make_store_request(const Record& incoming, const std::string& normalized_key,
                          std::chrono::system_clock::time_point now);

} // namespace record
} // namespace k7

#endif // K7_RECORD_SANITIZE_HPP
