#ifndef K7_STORE_FILE_RECORD_STORE_HPP
#define K7_STORE_FILE_RECORD_STORE_HPP

#include <filesystem>
#include <map>
#include <string>
#include "store/record_store.hpp"

namespace k7 {
namespace store {

// Durable store keeping one JSON document per record, addressed by the
// SHA-256 of its key:
//   {base_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
// Each document holds {"id": <id>, "record": <record object>}.
class FileRecordStore : public RecordStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates the base directory if needed and rebuilds the id index from the
  // documents found under it. Throws StoreError on an unreadable document.
  explicit FileRecordStore(const std::filesystem::path& base_path,
                           std::string role_key = DEFAULT_ROLE_KEY);


  // ---- QUERY OPERATIONS ----
  std::optional<StoredRecord> find_by_key(const std::string& key) const override;
  std::vector<StoredRecord> list() const override;
  bool has(const std::string& key) const;
  size_t size() const { return keys_by_id_.size(); }


  // ---- MUTATIONS ----
  RecordId create(const record::Record& record) override;
  void update(RecordId id, const record::Record& record) override;
  void set_metadata(RecordId id, const std::string& key, const Json::Value& value) override;
  void clear_roles(RecordId id) override;

  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all stored documents
  std::filesystem::path base_path_;
  std::string role_key_;
  RecordId next_id_ = 1;
  std::map<RecordId, std::string> keys_by_id_;
  std::map<std::string, RecordId> ids_by_key_;


  // ---- INDEX ----
  void rebuild_index();
  StoredRecord load(RecordId id) const;


  // ---- DOCUMENT IO ----
  StoredRecord read_document(const std::filesystem::path& file_path) const;
  // Writes through a temporary file renamed over the target
  void write_document(const StoredRecord& stored) const;


  // ---- CAS STORAGE SUPPORT ----
  // Generate SHA-256 hash from key using OpenSSL EVP
  std::string hash_key(const std::string& key) const;
  std::filesystem::path get_path_for_hash(const std::string& hash) const;
  std::filesystem::path resolve_key_path(const std::string& key) const;
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
};

} // namespace store
} // namespace k7

#endif // K7_STORE_FILE_RECORD_STORE_HPP
