#ifndef K7_RECORD_RECORD_JSON_HPP
#define K7_RECORD_RECORD_JSON_HPP

#include <json/json.h>
#include "record/record.hpp"

namespace k7 {
namespace record {

// ---- FIELD NAMES ----
// Canonical archive field names
namespace field {
constexpr const char* KEY = "key";
constexpr const char* CREDENTIAL_HASH = "credentialHash";
constexpr const char* EMAIL = "email";
constexpr const char* URL = "url";
constexpr const char* NICE_KEY = "niceKey";
constexpr const char* DISPLAY_NAME = "displayName";
constexpr const char* FIRST_NAME = "firstName";
constexpr const char* LAST_NAME = "lastName";
constexpr const char* DESCRIPTION = "description";
constexpr const char* REGISTERED_AT = "registeredAt";
constexpr const char* METADATA = "metadata";
} // namespace field


// ---- CONVERSION ----
// Writes canonical field names; extra fields are emitted as found
Json::Value to_json(const Record& record);

// Tolerant reader: accepts canonical or legacy field names, keeps unknown
// fields in attributes.extra. A non-object value yields an empty record.
Record from_json(const Json::Value& value);

Json::Value to_json(const RecordList& records);

} // namespace record
} // namespace k7

#endif // K7_RECORD_RECORD_JSON_HPP
