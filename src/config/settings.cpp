#include "config/settings.hpp"
#include <cstdlib>
#include <fstream>
#include <boost/log/trivial.hpp>
#include "logger/logger.hpp"

namespace k7 {
namespace config {

namespace {

const Json::Value* member(const Json::Value& root, const char* name) {
  const Json::Value* value = root.find(name, name + std::char_traits<char>::length(name));
  return (value && !value->isNull()) ? value : nullptr;
}

void read_string(const Json::Value& root, const char* name, std::string& out) {
  if (const Json::Value* value = member(root, name)) {
    if (!value->isString()) {
      throw ConfigError(std::string("Setting '") + name + "' must be a string");
    }
    out = value->asString();
  }
}

void read_path(const Json::Value& root, const char* name, std::filesystem::path& out) {
  std::string text = out.string();
  read_string(root, name, text);
  if (text.empty()) {
    throw ConfigError(std::string("Setting '") + name + "' must not be empty");
  }
  out = text;
}

uint64_t read_positive(const Json::Value& root, const char* name, uint64_t current) {
  const Json::Value* value = member(root, name);
  if (!value) {
    return current;
  }
  if (!value->isIntegral() || (value->isInt64() && value->asInt64() <= 0)) {
    throw ConfigError(std::string("Setting '") + name + "' must be a positive integer");
  }
  return value->asUInt64();
}

} // namespace

Settings Settings::from_json(const Json::Value& root) {
  if (!root.isObject()) {
    throw ConfigError("Settings document must be a JSON object");
  }

  Settings settings;
  read_string(root, "encryption_password", settings.encryption_password);
  read_path(root, "store_path", settings.store_path);
  read_path(root, "log_file", settings.log_file);
  read_string(root, "log_level", settings.log_level);
  read_path(root, "last_log_path", settings.last_log_path);
  read_string(root, "role_key", settings.role_key);
  read_string(root, "filename_prefix", settings.filename_prefix);

  settings.last_log_ttl = std::chrono::seconds(
      read_positive(root, "last_log_ttl_seconds", static_cast<uint64_t>(settings.last_log_ttl.count())));
  settings.max_archive_bytes = static_cast<size_t>(
      read_positive(root, "max_archive_bytes", settings.max_archive_bytes));

  if (!logger::parse_severity(settings.log_level)) {
    throw ConfigError("Unknown log level '" + settings.log_level + "'");
  }
  if (settings.role_key.empty()) {
    throw ConfigError("Setting 'role_key' must not be empty");
  }
  if (settings.filename_prefix.empty()) {
    throw ConfigError("Setting 'filename_prefix' must not be empty");
  }
  return settings;
}

Settings Settings::load(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(info) << "Settings: Loading configuration from " << path.string();

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw ConfigError("Cannot open settings file: " + path.string());
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
  if (!parsed) {
    throw ConfigError("Invalid settings file " + path.string() + ": " + errors);
  }
  return from_json(root);
}

void Settings::apply_environment() {
  const char* password = std::getenv(PASSWORD_ENV_VAR);
  if (password && *password) {
    BOOST_LOG_TRIVIAL(debug) << "Settings: Using encryption password from " << PASSWORD_ENV_VAR;
    encryption_password = password;
  }
}

} // namespace config
} // namespace k7
