#include "record/record_json.hpp"
#include <array>
#include <set>
#include <boost/log/trivial.hpp>

namespace k7 {
namespace record {

namespace {

// Maps an optional attribute to its canonical and legacy archive names
struct AttributeField {
  const char* name;
  const char* legacy;
  std::optional<std::string> Attributes::*member;
};

const std::array<AttributeField, 8> ATTRIBUTE_FIELDS = {{
  {field::EMAIL,         "user_email",      &Attributes::email},
  {field::URL,           "user_url",        &Attributes::url},
  {field::NICE_KEY,      "user_nicename",   &Attributes::nice_key},
  {field::DISPLAY_NAME,  "display_name",    &Attributes::display_name},
  {field::FIRST_NAME,    "first_name",      &Attributes::first_name},
  {field::LAST_NAME,     "last_name",       &Attributes::last_name},
  {field::DESCRIPTION,   "description",     &Attributes::description},
  {field::REGISTERED_AT, "user_registered", &Attributes::registered_at},
}};

constexpr const char* LEGACY_KEY = "user_login";
constexpr const char* LEGACY_CREDENTIAL_HASH = "user_pass";
constexpr const char* LEGACY_METADATA = "user_meta_data";

// Picks the canonical member if present, otherwise the legacy one
const char* resolve_name(const Json::Value& value, const char* name, const char* legacy) {
  if (value.isMember(name)) {
    return name;
  }
  if (legacy != nullptr && value.isMember(legacy)) {
    return legacy;
  }
  return nullptr;
}

// Scalars become strings, null means absent. Arrays and objects are not
// representable in a string field and are reported back to the caller.
bool read_scalar(const Json::Value& value, std::optional<std::string>& out) {
  if (value.isNull()) {
    out.reset();
    return true;
  }
  if (value.isString() || value.isNumeric() || value.isBool()) {
    out = value.asString();
    return true;
  }
  return false;
}

} // namespace

//==============================================
// SERIALIZATION
//==============================================

Json::Value to_json(const Record& record) {
  Json::Value out(Json::objectValue);

  // Extra fields first so known fields always win on a name clash
  for (const auto& name : record.attributes.extra.getMemberNames()) {
    out[name] = record.attributes.extra[name];
  }

  out[field::KEY] = record.key;
  if (record.credential_hash) {
    out[field::CREDENTIAL_HASH] = *record.credential_hash;
  }

  for (const auto& f : ATTRIBUTE_FIELDS) {
    const auto& attribute = record.attributes.*(f.member);
    if (attribute) {
      out[f.name] = *attribute;
    }
  }

  Json::Value metadata(Json::objectValue);
  for (const auto& [meta_key, meta_value] : record.metadata) {
    metadata[meta_key] = meta_value;
  }
  out[field::METADATA] = metadata;

  return out;
}

Json::Value to_json(const RecordList& records) {
  Json::Value out(Json::arrayValue);
  for (const auto& record : records) {
    out.append(to_json(record));
  }
  return out;
}

//==============================================
// DESERIALIZATION
//==============================================

Record from_json(const Json::Value& value) {
  Record record;

  if (!value.isObject()) {
    BOOST_LOG_TRIVIAL(warning) << "Record: Archive entry is not an object, treating it as a record without key";
    return record;
  }

  std::set<std::string> consumed;
  auto consume = [&](const char* name, const char* legacy) -> const char* {
    const char* found = resolve_name(value, name, legacy);
    consumed.insert(name);
    if (found != nullptr && found == legacy) {
      consumed.insert(legacy);
    }
    return found;
  };

  std::optional<std::string> scalar;
  std::vector<std::string> unreadable;

  if (const char* name = consume(field::KEY, LEGACY_KEY)) {
    if (read_scalar(value[name], scalar)) {
      record.key = scalar.value_or("");
    } else {
      unreadable.push_back(name);
    }
  }

  if (const char* name = consume(field::CREDENTIAL_HASH, LEGACY_CREDENTIAL_HASH)) {
    if (!read_scalar(value[name], record.credential_hash)) {
      unreadable.push_back(name);
    }
  }

  for (const auto& f : ATTRIBUTE_FIELDS) {
    if (const char* name = consume(f.name, f.legacy)) {
      if (!read_scalar(value[name], record.attributes.*(f.member))) {
        unreadable.push_back(name);
      }
    }
  }

  if (const char* name = consume(field::METADATA, LEGACY_METADATA)) {
    const Json::Value& metadata = value[name];
    if (metadata.isObject()) {
      for (const auto& meta_key : metadata.getMemberNames()) {
        record.metadata[meta_key] = metadata[meta_key];
      }
    } else if (!(metadata.isNull() || (metadata.isArray() && metadata.empty()))) {
      // An empty list is how some exporters write an empty map
      unreadable.push_back(name);
    }
  }

  // Fields that could not be mapped are kept as they are
  for (const auto& name : unreadable) {
    BOOST_LOG_TRIVIAL(warning) << "Record: Field '" << name << "' of record '" << record.key
                               << "' has an unexpected type, keeping it as an extra field";
    record.attributes.extra[name] = value[name];
  }
  for (const auto& name : value.getMemberNames()) {
    if (consumed.count(name) == 0) {
      record.attributes.extra[name] = value[name];
    }
  }

  return record;
}

} // namespace record
} // namespace k7
