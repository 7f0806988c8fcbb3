#pragma once
#include <string>
#include <unordered_map>
#include <optional>

// Key/value configuration loaded from a .env file. Process environment
// variables take precedence over file entries with the same key.
class ConfigManager {
public:
  static void Initialize(const std::string& env_path = ".env");
  static std::optional<std::string> Get(const std::string& key);
  static std::string GetOrThrow(const std::string& key);
  static int GetIntOr(const std::string& key, int default_value);
  static bool GetBoolOr(const std::string& key, bool default_value);
  // Overrides a value in the cache (tests, CLI flags)
  static void Set(const std::string& key, const std::string& value);
  static void Clear();
private:
  static std::unordered_map<std::string, std::string> cache_;
  static void LoadEnvFile(const std::string& env_path);
};
