#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <optional>

// Key/value configuration from a .env file. Keys missing from the file fall
// back to the process environment.
class ConfigManager {
public:
  static void Initialize(const std::string& env_path = ".env");
  static std::optional<std::string> Get(const std::string& key);
  static std::string GetOrThrow(const std::string& key);
  static std::string GetStringOr(const std::string& key, const std::string& default_value);
  static uint64_t GetUint64Or(const std::string& key, uint64_t default_value);
  static bool GetBoolOr(const std::string& key, bool default_value);
  static void Set(const std::string& key, const std::string& value);
  static void Clear();
private:
  static std::unordered_map<std::string, std::string> cache_;
  static void LoadEnvFile(const std::string& env_path);
};
