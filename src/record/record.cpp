#include "record/record.hpp"
#include <algorithm>

namespace k7 {
namespace record {

namespace {

// Json::Value equality, except that signed and unsigned integers compare by
// number. A parsed document stores every integer that fits in Int64 as
// intValue, whatever type it was written from.
bool same_value(const Json::Value& a, const Json::Value& b) {
  const bool a_int = a.type() == Json::intValue || a.type() == Json::uintValue;
  const bool b_int = b.type() == Json::intValue || b.type() == Json::uintValue;
  if (a_int || b_int) {
    if (!(a_int && b_int)) {
      return false;
    }
    if (a.isInt64() && b.isInt64()) {
      return a.asInt64() == b.asInt64();
    }
    return a.isUInt64() && b.isUInt64() && a.asUInt64() == b.asUInt64();
  }

  if (a.type() != b.type()) {
    return false;
  }
  if (a.isArray()) {
    if (a.size() != b.size()) {
      return false;
    }
    for (Json::ArrayIndex i = 0; i < a.size(); ++i) {
      if (!same_value(a[i], b[i])) {
        return false;
      }
    }
    return true;
  }
  if (a.isObject()) {
    if (a.getMemberNames() != b.getMemberNames()) {
      return false;
    }
    for (const auto& name : a.getMemberNames()) {
      if (!same_value(a[name], b[name])) {
        return false;
      }
    }
    return true;
  }
  return a == b;
}

bool same_metadata(const Metadata& a, const Metadata& b) {
  return a.size() == b.size()
      && std::equal(a.begin(), a.end(), b.begin(),
                    [](const auto& x, const auto& y) { return x.first == y.first && same_value(x.second, y.second); });
}

} // namespace

bool Attributes::operator==(const Attributes& other) const {
  return email == other.email
      && url == other.url
      && nice_key == other.nice_key
      && display_name == other.display_name
      && first_name == other.first_name
      && last_name == other.last_name
      && description == other.description
      && registered_at == other.registered_at
      && same_value(extra, other.extra);
}

bool Record::operator==(const Record& other) const {
  return key == other.key
      && credential_hash == other.credential_hash
      && attributes == other.attributes
      && same_metadata(metadata, other.metadata);
}

} // namespace record
} // namespace k7
