#ifndef K7_STORE_RECORD_STORE_HPP
#define K7_STORE_RECORD_STORE_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <json/json.h>
#include "record/record.hpp"

namespace k7 {
namespace store {

using RecordId = uint64_t;

// Role metadata key used when none is configured
constexpr const char* DEFAULT_ROLE_KEY = "wp_capabilities";

struct StoredRecord {
  RecordId id = 0;
  record::Record record;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Identity store seen by export and import. Keys are unique; every mutating
// call throws StoreError on failure and leaves the stored record unchanged.
class RecordStore {
public:
  virtual ~RecordStore() = default;

  // ---- QUERY OPERATIONS ----
  virtual std::optional<StoredRecord> find_by_key(const std::string& key) const = 0;
  // All records in id order
  virtual std::vector<StoredRecord> list() const = 0;


  // ---- MUTATIONS ----
  // Stores key, credential and attributes of a new record and returns its id.
  // The key must be non-empty and unused and a credential hash is required.
  virtual RecordId create(const record::Record& record) = 0;
  // Replaces credential and attributes of an existing record. Metadata is
  // kept and the key cannot change.
  virtual void update(RecordId id, const record::Record& record) = 0;
  // Inserts or replaces one metadata entry
  virtual void set_metadata(RecordId id, const std::string& key, const Json::Value& value) = 0;
  // Removes every role held by the record
  virtual void clear_roles(RecordId id) = 0;
};

} // namespace store
} // namespace k7

#endif // K7_STORE_RECORD_STORE_HPP
