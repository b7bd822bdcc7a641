#pragma once
#include <string>
#include <unordered_map>
#include <optional>
#include <vector>

// KEY=VALUE settings from a .env file. A process environment variable with the
// same name takes precedence over the file.
class ConfigManager {
public:
  // Returns false when the file could not be opened; only the process
  // environment is consulted then.
  static bool Initialize(const std::string& env_path = ".env");
  // Test hook: replaces the file-backed values.
  static void Set(const std::string& key, const std::string& value);
  static void Clear();
  static std::optional<std::string> Get(const std::string& key);
  static std::string GetOrThrow(const std::string& key);
  static int GetIntOr(const std::string& key, int default_value);
  static unsigned long long GetUint64Or(const std::string& key, unsigned long long default_value);
  static double GetDoubleOr(const std::string& key, double default_value);
  static bool GetBoolOr(const std::string& key, bool default_value);
  // Comma-separated list, empty items dropped, items trimmed.
  static std::vector<std::string> GetListOr(const std::string& key, const std::vector<std::string>& default_value);
private:
  static std::unordered_map<std::string, std::string> cache_;
  static bool LoadEnvFile(const std::string& env_path);
};
