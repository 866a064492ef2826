#include "store/memory_record_store.hpp"
#include <boost/log/trivial.hpp>

namespace k7 {
namespace store {

MemoryRecordStore::MemoryRecordStore(std::string role_key)
  : role_key_(std::move(role_key)) {}

std::optional<StoredRecord> MemoryRecordStore::find_by_key(const std::string& key) const {
  auto it = ids_by_key_.find(key);
  if (it == ids_by_key_.end()) {
    return std::nullopt;
  }
  return StoredRecord{it->second, records_.at(it->second)};
}

std::vector<StoredRecord> MemoryRecordStore::list() const {
  std::vector<StoredRecord> out;
  out.reserve(records_.size());
  for (const auto& [id, record] : records_) {
    out.push_back(StoredRecord{id, record});
  }
  return out;
}

RecordId MemoryRecordStore::create(const record::Record& record) {
  if (record.key.empty()) {
    throw StoreError("MemoryRecordStore: Record key is empty");
  }
  if (!record.credential_hash) {
    throw StoreError("MemoryRecordStore: Credential hash is required for " + record.key);
  }
  if (ids_by_key_.count(record.key) != 0) {
    throw StoreError("MemoryRecordStore: Record key already exists: " + record.key);
  }

  RecordId id = next_id_++;
  record::Record stored = record;
  stored.metadata.clear();
  records_.emplace(id, std::move(stored));
  ids_by_key_.emplace(record.key, id);

  BOOST_LOG_TRIVIAL(debug) << "MemoryRecordStore: Created record " << id << " for key: " << record.key;
  return id;
}

void MemoryRecordStore::update(RecordId id, const record::Record& record) {
  record::Record& existing = get(id);
  if (record.key != existing.key) {
    throw StoreError("MemoryRecordStore: Record key cannot change from " + existing.key + " to " + record.key);
  }

  if (record.credential_hash) {
    existing.credential_hash = record.credential_hash;
  }
  existing.attributes = record.attributes;
  BOOST_LOG_TRIVIAL(debug) << "MemoryRecordStore: Updated record " << id;
}

void MemoryRecordStore::set_metadata(RecordId id, const std::string& key, const Json::Value& value) {
  if (key.empty()) {
    throw StoreError("MemoryRecordStore: Metadata key is empty");
  }
  get(id).metadata[key] = value;
}

void MemoryRecordStore::clear_roles(RecordId id) {
  get(id).metadata[role_key_] = Json::Value(Json::objectValue);
}

record::Record& MemoryRecordStore::get(RecordId id) {
  auto it = records_.find(id);
  if (it == records_.end()) {
    throw StoreError("MemoryRecordStore: No record with id " + std::to_string(id));
  }
  return it->second;
}

} // namespace store
} // namespace k7
