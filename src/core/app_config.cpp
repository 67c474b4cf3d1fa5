#include "core/app_config.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>

AppSettings AppConfig::settings_;
bool AppConfig::initialized_ = false;
std::mutex AppConfig::configMutex_;

namespace {

std::string escapeConnectionParam(const std::string &param) {
  std::string escaped = "'";
  for (char c : param) {
    if (c == '\'' || c == '\\') {
      escaped += '\\';
    }
    escaped += c;
  }
  escaped += "'";
  return escaped;
}

bool validatePort(const std::string &portStr) {
  if (portStr.empty() || portStr.length() > 5)
    return false;

  for (char c : portStr) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
  }

  int portNum = std::stoi(portStr);
  return portNum > 0 && portNum <= 65535;
}

std::string rangeMessage(const std::string &key, long long minValue,
                         long long maxValue) {
  return key + " must be between " + std::to_string(minValue) + " and " +
         std::to_string(maxValue);
}

const char *nonEmptyEnv(const char *name) {
  const char *value = std::getenv(name);
  if (value && std::strlen(value) > 0)
    return value;
  return nullptr;
}

bool parseBool(const std::string &value) {
  std::string lowered = StringUtils::toLower(StringUtils::trim(value));
  return lowered == "true" || lowered == "1" || lowered == "yes";
}

} // namespace

std::string LogDatabaseSettings::connectionString() const {
  return "host=" + escapeConnectionParam(host) +
         " dbname=" + escapeConnectionParam(database) +
         " user=" + escapeConnectionParam(user) +
         " password=" + escapeConnectionParam(password) +
         " port=" + escapeConnectionParam(port);
}

std::string isolationModeToString(IsolationMode mode) {
  switch (mode) {
  case IsolationMode::OFF:
    return "off";
  case IsolationMode::BEST_EFFORT:
    return "best_effort";
  case IsolationMode::REQUIRED:
    return "required";
  }
  return "best_effort";
}

IsolationMode isolationModeFromString(const std::string &value,
                                      const std::string &key) {
  std::string lowered = StringUtils::toLower(StringUtils::trim(value));
  if (lowered == "off" || lowered == "none" || lowered == "false")
    return IsolationMode::OFF;
  if (lowered == "best_effort" || lowered == "best-effort")
    return IsolationMode::BEST_EFFORT;
  if (lowered == "required" || lowered == "true")
    return IsolationMode::REQUIRED;
  throw std::invalid_argument(key +
                              " must be one of off, best_effort, required "
                              "(got '" +
                              value + "')");
}

void validateExecutionSettings(const ExecutionSettings &settings) {
  if (settings.timeout_seconds < ConfigLimits::MIN_EXECUTION_TIMEOUT ||
      settings.timeout_seconds > ConfigLimits::MAX_EXECUTION_TIMEOUT) {
    throw std::invalid_argument(rangeMessage("execution.timeout_seconds",
                                             ConfigLimits::MIN_EXECUTION_TIMEOUT,
                                             ConfigLimits::MAX_EXECUTION_TIMEOUT));
  }
  if (settings.memory_limit_mb < ConfigLimits::MIN_MEMORY_LIMIT_MB ||
      settings.memory_limit_mb > ConfigLimits::MAX_MEMORY_LIMIT_MB) {
    throw std::invalid_argument(rangeMessage(
        "execution.memory_limit_mb", ConfigLimits::MIN_MEMORY_LIMIT_MB,
        ConfigLimits::MAX_MEMORY_LIMIT_MB));
  }
  if (settings.max_output_bytes < ConfigLimits::MIN_OUTPUT_BYTES ||
      settings.max_output_bytes > ConfigLimits::MAX_OUTPUT_BYTES) {
    throw std::invalid_argument(rangeMessage("execution.max_output_bytes",
                                             ConfigLimits::MIN_OUTPUT_BYTES,
                                             ConfigLimits::MAX_OUTPUT_BYTES));
  }
  if (settings.max_open_files < ConfigLimits::MIN_OPEN_FILES ||
      settings.max_open_files > ConfigLimits::MAX_OPEN_FILES) {
    throw std::invalid_argument(rangeMessage("execution.max_open_files",
                                             ConfigLimits::MIN_OPEN_FILES,
                                             ConfigLimits::MAX_OPEN_FILES));
  }
  if (settings.python_executable.empty()) {
    throw std::invalid_argument("execution.python_executable must not be empty");
  }
  if (settings.work_root.empty()) {
    throw std::invalid_argument("execution.work_root must not be empty");
  }
}

void validateServerSettings(const ServerSettings &settings) {
  if (settings.workers < ConfigLimits::MIN_WORKERS ||
      settings.workers > ConfigLimits::MAX_WORKERS) {
    throw std::invalid_argument(rangeMessage("server.workers",
                                             ConfigLimits::MIN_WORKERS,
                                             ConfigLimits::MAX_WORKERS));
  }
}

AppSettings AppConfig::parseSettings(const json &config, AppSettings base) {
  if (config.contains("generation")) {
    const auto &gen = config["generation"];
    base.generation.api_key = gen.value("api_key", base.generation.api_key);
    base.generation.base_url = gen.value("base_url", base.generation.base_url);
    base.generation.model = gen.value("model", base.generation.model);
    base.generation.max_tokens =
        gen.value("max_tokens", base.generation.max_tokens);
    base.generation.timeout_seconds =
        gen.value("timeout_seconds", base.generation.timeout_seconds);
  }

  if (config.contains("paradigm")) {
    const auto &par = config["paradigm"];
    base.paradigm.api_key = par.value("api_key", base.paradigm.api_key);
    base.paradigm.base_url = par.value("base_url", base.paradigm.base_url);
    base.paradigm.request_timeout_seconds = par.value(
        "request_timeout_seconds", base.paradigm.request_timeout_seconds);
    base.paradigm.analysis_max_wait_seconds = par.value(
        "analysis_max_wait_seconds", base.paradigm.analysis_max_wait_seconds);
    base.paradigm.analysis_poll_interval_seconds =
        par.value("analysis_poll_interval_seconds",
                  base.paradigm.analysis_poll_interval_seconds);
    base.paradigm.chat_model = par.value("chat_model", base.paradigm.chat_model);
  }

  if (config.contains("execution")) {
    const auto &exe = config["execution"];
    base.execution.timeout_seconds =
        exe.value("timeout_seconds", base.execution.timeout_seconds);
    base.execution.python_executable =
        exe.value("python_executable", base.execution.python_executable);
    base.execution.memory_limit_mb =
        exe.value("memory_limit_mb", base.execution.memory_limit_mb);
    base.execution.max_output_bytes =
        exe.value("max_output_bytes", base.execution.max_output_bytes);
    base.execution.max_open_files =
        exe.value("max_open_files", base.execution.max_open_files);
    base.execution.max_file_size_mb =
        exe.value("max_file_size_mb", base.execution.max_file_size_mb);
    if (exe.contains("network_isolation")) {
      base.execution.network_isolation = isolationModeFromString(
          exe["network_isolation"].get<std::string>(),
          "execution.network_isolation");
    }
    if (exe.contains("filesystem_isolation")) {
      base.execution.filesystem_isolation = isolationModeFromString(
          exe["filesystem_isolation"].get<std::string>(),
          "execution.filesystem_isolation");
    }
    base.execution.work_root = exe.value("work_root", base.execution.work_root);
  }

  if (config.contains("server")) {
    const auto &srv = config["server"];
    base.server.workers = srv.value("workers", base.server.workers);
    base.server.debug = srv.value("debug", base.server.debug);
  }

  if (config.contains("logging")) {
    const auto &log = config["logging"];
    base.logging.level = log.value("level", base.logging.level);
    base.logging.file = log.value("file", base.logging.file);
    base.logging.max_file_size_mb =
        log.value("max_file_size_mb", base.logging.max_file_size_mb);
    base.logging.max_backup_files =
        log.value("max_backup_files", base.logging.max_backup_files);

    if (log.contains("database")) {
      const auto &db = log["database"];
      auto &target = base.logging.database;
      target.enabled = db.value("enabled", target.enabled);
      target.host = db.value("host", target.host);
      target.database = db.value("database", target.database);
      target.user = db.value("user", target.user);
      target.password = db.value("password", target.password);
      if (db.contains("port")) {
        std::string port = db["port"].is_string()
                               ? db["port"].get<std::string>()
                               : std::to_string(db["port"].get<int>());
        if (validatePort(port)) {
          target.port = port;
        } else {
          Logger::warning(LogCategory::CONFIG, "AppConfig",
                          "Invalid port number: " + port +
                              ", using default: " + target.port);
        }
      }
    }
  }

  validateExecutionSettings(base.execution);
  validateServerSettings(base.server);
  return base;
}

// Loads settings from a JSON file, then applies environment overrides. An
// unreadable or malformed file is not fatal: the defaults plus environment
// are used instead. Out-of-range values are fatal and propagate as
// std::invalid_argument.
void AppConfig::loadFromFile(const std::string &configPath) {
  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    Logger::warning(LogCategory::CONFIG, "AppConfig",
                    "Could not open config file '" + configPath +
                        "', using defaults and environment variables");
    loadFromEnv();
    return;
  }

  AppSettings parsed;
  try {
    json config;
    configFile >> config;
    parsed = parseSettings(config, AppSettings{});
  } catch (const json::exception &e) {
    Logger::error(LogCategory::CONFIG, "AppConfig",
                  "Error parsing config file '" + configPath +
                      "': " + std::string(e.what()) +
                      ", falling back to environment variables");
    loadFromEnv();
    return;
  }

  std::lock_guard<std::mutex> lock(configMutex_);
  applyEnvironmentUnlocked(parsed);
  settings_ = parsed;
  initialized_ = true;
}

void AppConfig::loadFromEnv() {
  std::lock_guard<std::mutex> lock(configMutex_);
  AppSettings settings;
  applyEnvironmentUnlocked(settings);
  settings_ = settings;
  initialized_ = true;
}

void AppConfig::applyEnvironmentUnlocked(AppSettings &settings) {
  if (const char *key = nonEmptyEnv("ANTHROPIC_API_KEY"))
    settings.generation.api_key = key;
  if (const char *key = nonEmptyEnv("LIGHTON_API_KEY"))
    settings.paradigm.api_key = key;
  if (const char *debug = nonEmptyEnv("DEBUG"))
    settings.server.debug = parseBool(debug);
  if (const char *level = nonEmptyEnv("LOG_LEVEL"))
    settings.logging.level = level;

  if (const char *timeout = nonEmptyEnv("EXECUTION_TIMEOUT_SECONDS")) {
    try {
      settings.execution.timeout_seconds = std::stoi(timeout);
    } catch (const std::exception &) {
      throw std::invalid_argument(
          "EXECUTION_TIMEOUT_SECONDS is not a number: " + std::string(timeout));
    }
  }

  auto &db = settings.logging.database;
  if (const char *host = nonEmptyEnv("POSTGRES_HOST")) {
    db.host = host;
    db.enabled = true;
  }
  if (const char *port = nonEmptyEnv("POSTGRES_PORT")) {
    if (validatePort(port)) {
      db.port = port;
    } else {
      Logger::warning(LogCategory::CONFIG, "AppConfig",
                      "Invalid port number: " + std::string(port) +
                          ", using default: " + db.port);
    }
  }
  if (const char *name = nonEmptyEnv("POSTGRES_DB"))
    db.database = name;
  if (const char *user = nonEmptyEnv("POSTGRES_USER"))
    db.user = user;
  if (const char *password = std::getenv("POSTGRES_PASSWORD"))
    db.password = password;

  validateExecutionSettings(settings.execution);
  validateServerSettings(settings.server);

  if (settings.generation.api_key.empty()) {
    Logger::warning(LogCategory::CONFIG, "AppConfig",
                    "ANTHROPIC_API_KEY not set in config file or environment. "
                    "Workflow generation will be unavailable.");
  }
}

void AppConfig::setForTesting(const AppSettings &settings) {
  validateExecutionSettings(settings.execution);
  validateServerSettings(settings.server);
  std::lock_guard<std::mutex> lock(configMutex_);
  settings_ = settings;
  initialized_ = true;
}
