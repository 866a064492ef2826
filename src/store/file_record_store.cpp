#include "store/file_record_store.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>
#include "record/record_json.hpp"

namespace k7 {
namespace store {

namespace {
constexpr const char* TMP_SUFFIX = ".tmp";
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileRecordStore::FileRecordStore(const std::filesystem::path& base_path, std::string role_key)
  : base_path_(base_path)
  , role_key_(std::move(role_key)) {
  BOOST_LOG_TRIVIAL(info) << "FileRecordStore: Initializing store with base path: " << base_path_.string();
  check_directory_exists(base_path_);
  rebuild_index();
  BOOST_LOG_TRIVIAL(info) << "FileRecordStore: Loaded " << keys_by_id_.size() << " records";
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::optional<StoredRecord> FileRecordStore::find_by_key(const std::string& key) const {
  BOOST_LOG_TRIVIAL(debug) << "FileRecordStore: Looking up key: " << key;

  auto it = ids_by_key_.find(key);
  if (it == ids_by_key_.end()) {
    return std::nullopt;
  }
  return load(it->second);
}

std::vector<StoredRecord> FileRecordStore::list() const {
  std::vector<StoredRecord> out;
  out.reserve(keys_by_id_.size());
  for (const auto& entry : keys_by_id_) {
    out.push_back(load(entry.first));
  }
  return out;
}

bool FileRecordStore::has(const std::string& key) const {
  return ids_by_key_.count(key) != 0;
}


//==============================================
// MUTATIONS
//==============================================

RecordId FileRecordStore::create(const record::Record& record) {
  BOOST_LOG_TRIVIAL(info) << "FileRecordStore: Creating record with key: " << record.key;

  if (record.key.empty()) {
    throw StoreError("FileRecordStore: Record key is empty");
  }
  if (!record.credential_hash) {
    throw StoreError("FileRecordStore: Credential hash is required for " + record.key);
  }
  if (has(record.key)) {
    BOOST_LOG_TRIVIAL(error) << "FileRecordStore: Key already exists: " << record.key;
    throw StoreError("FileRecordStore: Record key already exists: " + record.key);
  }

  StoredRecord stored{next_id_, record};
  stored.record.metadata.clear();
  write_document(stored);

  keys_by_id_.emplace(stored.id, record.key);
  ids_by_key_.emplace(record.key, stored.id);
  ++next_id_;

  BOOST_LOG_TRIVIAL(info) << "FileRecordStore: Created record " << stored.id;
  return stored.id;
}

void FileRecordStore::update(RecordId id, const record::Record& record) {
  BOOST_LOG_TRIVIAL(info) << "FileRecordStore: Updating record " << id;

  StoredRecord stored = load(id);
  if (record.key != stored.record.key) {
    throw StoreError("FileRecordStore: Record key cannot change from " + stored.record.key + " to " + record.key);
  }

  if (record.credential_hash) {
    stored.record.credential_hash = record.credential_hash;
  }
  stored.record.attributes = record.attributes;
  write_document(stored);
}

void FileRecordStore::set_metadata(RecordId id, const std::string& key, const Json::Value& value) {
  BOOST_LOG_TRIVIAL(debug) << "FileRecordStore: Setting metadata " << key << " on record " << id;

  if (key.empty()) {
    throw StoreError("FileRecordStore: Metadata key is empty");
  }
  StoredRecord stored = load(id);
  stored.record.metadata[key] = value;
  write_document(stored);
}

void FileRecordStore::clear_roles(RecordId id) {
  BOOST_LOG_TRIVIAL(debug) << "FileRecordStore: Clearing roles of record " << id;

  StoredRecord stored = load(id);
  stored.record.metadata[role_key_] = Json::Value(Json::objectValue);
  write_document(stored);
}


//==============================================
// INDEX
//==============================================

void FileRecordStore::rebuild_index() {
  std::vector<std::filesystem::path> documents;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(base_path_)) {
    if (entry.is_regular_file()) {
      documents.push_back(entry.path());
    }
  }

  for (const auto& path : documents) {
    // Leftover of an interrupted write, the previous document is still intact
    if (path.extension() == TMP_SUFFIX) {
      BOOST_LOG_TRIVIAL(warning) << "FileRecordStore: Removing stale temporary file: " << path.string();
      std::filesystem::remove(path);
      continue;
    }

    StoredRecord stored = read_document(path);
    if (stored.id == 0 || keys_by_id_.count(stored.id) != 0 || ids_by_key_.count(stored.record.key) != 0) {
      BOOST_LOG_TRIVIAL(error) << "FileRecordStore: Duplicate or invalid id in " << path.string();
      throw StoreError("FileRecordStore: Duplicate or invalid record id in " + path.string());
    }

    keys_by_id_.emplace(stored.id, stored.record.key);
    ids_by_key_.emplace(stored.record.key, stored.id);
    if (stored.id >= next_id_) {
      next_id_ = stored.id + 1;
    }
  }
}

StoredRecord FileRecordStore::load(RecordId id) const {
  auto it = keys_by_id_.find(id);
  if (it == keys_by_id_.end()) {
    throw StoreError("FileRecordStore: No record with id " + std::to_string(id));
  }
  return read_document(resolve_key_path(it->second));
}


//==============================================
// DOCUMENT IO
//==============================================

StoredRecord FileRecordStore::read_document(const std::filesystem::path& file_path) const {
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "FileRecordStore: Failed to open file: " << file_path.string();
    throw StoreError("FileRecordStore: Failed to open file: " + file_path.string());
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
  if (!parsed || !root.isObject()
      || !root["id"].isUInt64() || !root["record"].isObject()) {
    BOOST_LOG_TRIVIAL(error) << "FileRecordStore: Corrupt record document " << file_path.string() << ": " << errors;
    throw StoreError("FileRecordStore: Corrupt record document: " + file_path.string());
  }

  return StoredRecord{root["id"].asUInt64(), record::from_json(root["record"])};
}

void FileRecordStore::write_document(const StoredRecord& stored) const {
  std::filesystem::path file_path = resolve_key_path(stored.record.key);
  std::filesystem::path tmp_path = file_path;
  tmp_path += TMP_SUFFIX;

  Json::Value root(Json::objectValue);
  root["id"] = Json::UInt64(stored.id);
  root["record"] = record::to_json(stored.record);

  try {
    check_directory_exists(file_path.parent_path());

    std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StoreError("FileRecordStore: Failed to create file: " + tmp_path.string());
    }
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    writer["emitUTF8"] = true;
    file << Json::writeString(writer, root);
    file.close();
    if (!file) {
      throw StoreError("FileRecordStore: Failed to write file: " + tmp_path.string());
    }

    std::filesystem::rename(tmp_path, file_path);
  }
  catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "FileRecordStore: Filesystem error: " << e.what();
    throw StoreError("FileRecordStore: Failed to write record: " + std::string(e.what()));
  }

  BOOST_LOG_TRIVIAL(debug) << "FileRecordStore: Wrote record " << stored.id << " to " << file_path.string();
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::string FileRecordStore::hash_key(const std::string& key) const {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;

  // Create a new message digest context for the hashing operation
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw StoreError("FileRecordStore: Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)
      || !EVP_DigestUpdate(ctx, key.c_str(), key.length())
      || !EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("FileRecordStore: Failed to hash key");
  }
  EVP_MD_CTX_free(ctx);

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::filesystem::path FileRecordStore::get_path_for_hash(const std::string& hash) const {
  std::filesystem::path path = base_path_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}

std::filesystem::path FileRecordStore::resolve_key_path(const std::string& key) const {
  return get_path_for_hash(hash_key(key));
}

void FileRecordStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

} // namespace store
} // namespace k7
