#ifndef APP_CONFIG_H
#define APP_CONFIG_H

#include <nlohmann/json.hpp>
#include <cstddef>
#include <mutex>
#include <string>

using json = nlohmann::json;

enum class IsolationMode { OFF, BEST_EFFORT, REQUIRED };

struct GenerationSettings {
  std::string api_key;
  std::string base_url = "https://api.anthropic.com";
  std::string model = "claude-3-sonnet-20240229";
  int max_tokens = 4000;
  int timeout_seconds = 120;
};

struct ParadigmSettings {
  std::string api_key;
  std::string base_url = "https://paradigm.lighton.ai";
  int request_timeout_seconds = 60;
  int analysis_max_wait_seconds = 300;
  int analysis_poll_interval_seconds = 5;
  std::string chat_model = "alfred-4.2";
};

struct ExecutionSettings {
  int timeout_seconds = 300;
  std::string python_executable = "python3";
  size_t memory_limit_mb = 1024;
  size_t max_output_bytes = 1024 * 1024;
  int max_open_files = 64;
  size_t max_file_size_mb = 16;
  IsolationMode network_isolation = IsolationMode::BEST_EFFORT;
  // Private user/mount/pid namespaces and a minimal read-only view of the
  // host file system.
  IsolationMode filesystem_isolation = IsolationMode::BEST_EFFORT;
  std::string work_root = "/tmp";
};

struct ServerSettings {
  size_t workers = 4;
  bool debug = false;
};

struct LogDatabaseSettings {
  bool enabled = false;
  std::string host = "localhost";
  std::string port = "5432";
  std::string database = "flowforge";
  std::string user = "postgres";
  std::string password;

  std::string connectionString() const;
};

struct LoggingSettings {
  std::string level = "INFO";
  std::string file;
  size_t max_file_size_mb = 10;
  int max_backup_files = 5;
  LogDatabaseSettings database;
};

struct AppSettings {
  GenerationSettings generation;
  ParadigmSettings paradigm;
  ExecutionSettings execution;
  ServerSettings server;
  LoggingSettings logging;
};

namespace ConfigLimits {
constexpr int MIN_EXECUTION_TIMEOUT = 1;
constexpr int MAX_EXECUTION_TIMEOUT = 3600;
constexpr size_t MIN_MEMORY_LIMIT_MB = 64;
constexpr size_t MAX_MEMORY_LIMIT_MB = 65536;
constexpr size_t MIN_OUTPUT_BYTES = 1024;
constexpr size_t MAX_OUTPUT_BYTES = 64 * 1024 * 1024;
constexpr int MIN_OPEN_FILES = 16;
constexpr int MAX_OPEN_FILES = 4096;
constexpr size_t MIN_WORKERS = 1;
constexpr size_t MAX_WORKERS = 64;
} // namespace ConfigLimits

std::string isolationModeToString(IsolationMode mode);
// `key` names the setting in the error message.
IsolationMode isolationModeFromString(const std::string &value,
                                      const std::string &key);

// Both throw std::invalid_argument naming the offending key and its range.
void validateExecutionSettings(const ExecutionSettings &settings);
void validateServerSettings(const ServerSettings &settings);

class AppConfig {
private:
  static AppSettings settings_;
  static bool initialized_;
  static std::mutex configMutex_;

  static void applyEnvironmentUnlocked(AppSettings &settings);

public:
  static void loadFromFile(const std::string &configPath = "config.json");
  static void loadFromEnv();

  // Overlays the recognised sections of `config` onto `base` and validates
  // the result.
  static AppSettings parseSettings(const json &config, AppSettings base);

  static AppSettings getSettings() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return settings_;
  }

  static bool isInitialized() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return initialized_;
  }

  static bool hasGenerationCredentials() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return !settings_.generation.api_key.empty();
  }

  static void setForTesting(const AppSettings &settings);
};

#endif
