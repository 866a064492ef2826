#ifndef K7_STORE_MEMORY_RECORD_STORE_HPP
#define K7_STORE_MEMORY_RECORD_STORE_HPP

#include <map>
#include "store/record_store.hpp"

namespace k7 {
namespace store {

// In-process store, ids assigned from 1
class MemoryRecordStore : public RecordStore {
public:
  explicit MemoryRecordStore(std::string role_key = DEFAULT_ROLE_KEY);

  std::optional<StoredRecord> find_by_key(const std::string& key) const override;
  std::vector<StoredRecord> list() const override;

  RecordId create(const record::Record& record) override;
  void update(RecordId id, const record::Record& record) override;
  void set_metadata(RecordId id, const std::string& key, const Json::Value& value) override;
  void clear_roles(RecordId id) override;

  size_t size() const { return records_.size(); }

private:
  std::string role_key_;
  RecordId next_id_ = 1;
  std::map<RecordId, record::Record> records_;
  std::map<std::string, RecordId> ids_by_key_;

  record::Record& get(RecordId id);
};

} // namespace store
} // namespace k7

#endif // K7_STORE_MEMORY_RECORD_STORE_HPP
