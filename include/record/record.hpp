#ifndef K7_RECORD_RECORD_HPP
#define K7_RECORD_RECORD_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

namespace k7 {
namespace record {

// Known scalar profile fields. Anything else found at the top level of an
// archived record is kept verbatim in `extra` and written back on export.
struct Attributes {
  std::optional<std::string> email;
  std::optional<std::string> url;
  std::optional<std::string> nice_key;
  std::optional<std::string> display_name;
  std::optional<std::string> first_name;
  std::optional<std::string> last_name;
  std::optional<std::string> description;
  std::optional<std::string> registered_at;
  Json::Value extra = Json::Value(Json::objectValue);

  bool operator==(const Attributes& other) const;
  bool operator!=(const Attributes& other) const { return !(*this == other); }
};

// Metadata values are scalars or structured values (role sets and the like)
using Metadata = std::map<std::string, Json::Value>;

struct Record {
  std::string key;
  std::optional<std::string> credential_hash;
  Attributes attributes;
  Metadata metadata;

  bool operator==(const Record& other) const;
  bool operator!=(const Record& other) const { return !(*this == other); }
};

using RecordList = std::vector<Record>;

} // namespace record
} // namespace k7

#endif // K7_RECORD_RECORD_HPP
