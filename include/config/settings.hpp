#ifndef K7_CONFIG_SETTINGS_HPP
#define K7_CONFIG_SETTINGS_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <json/json.h>

namespace k7 {
namespace config {

// Environment variable overriding the configured encryption password
constexpr const char* PASSWORD_ENV_VAR = "K7_ENCRYPTION_PASSWORD";

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct Settings {
  std::string encryption_password;
  std::filesystem::path store_path = "k7_store";
  std::filesystem::path log_file = "k7port.log";
  std::string log_level = "info";
  std::filesystem::path last_log_path = "k7_last_log.json";
  std::chrono::seconds last_log_ttl{3600};
  std::string role_key = "wp_capabilities";
  size_t max_archive_bytes = 5 * 1024 * 1024;
  std::string filename_prefix = "Usersk7";

  // Keys absent from the document keep their defaults. A key of the wrong
  // type or an out of range value throws ConfigError.
  static Settings from_json(const Json::Value& root);
  // Throws ConfigError when the file cannot be read or parsed
  static Settings load(const std::filesystem::path& path);

  // Applies K7_ENCRYPTION_PASSWORD when it is set and non-empty
  void apply_environment();
};

} // namespace config
} // namespace k7

#endif // K7_CONFIG_SETTINGS_HPP
