#ifndef LOGGER_H
#define LOGGER_H

#include "core/database_log_writer.h"
#include "core/log_writer.h"
#include <chrono>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

struct LoggingSettings;

enum class LogLevel {
  DEBUG = 0,
  INFO = 1,
  WARNING = 2,
  ERROR = 3,
  CRITICAL = 4
};

enum class LogCategory {
  SYSTEM = 0,
  CONFIG = 1,
  GENERATION = 2,
  VALIDATION = 3,
  EXECUTION = 4,
  SANDBOX = 5,
  CAPABILITY = 6,
  STORE = 7,
  SERVICE = 8,
  DATABASE = 9
};

class Logger {
private:
  static std::vector<std::unique_ptr<ILogWriter>> writers_;
  static std::unique_ptr<DatabaseLogWriter> dbWriter_;
  static std::mutex logMutex;

  static LogLevel currentLogLevel;
  static bool showTimestamps;
  static std::mutex configMutex;

  static const std::unordered_map<std::string, LogLevel> levelMap;

  static std::string formatLogMessage(const std::string &timestamp,
                                      const std::string &levelStr,
                                      const std::string &categoryStr,
                                      const std::string &function,
                                      const std::string &message) {
    std::ostringstream oss;
    if (!timestamp.empty()) {
      oss << "[" << timestamp << "] ";
    }
    oss << "[" << levelStr << "] [" << categoryStr << "]";
    if (!function.empty()) {
      oss << " [" << function << "]";
    }
    oss << " " << message;
    return oss.str();
  }

  static std::string getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;

    std::stringstream ss;
    localtime_r(&time_t, &tm_buf);
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
  }

  static std::string getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::CRITICAL:
      return "CRITICAL";
    default:
      return "UNKNOWN";
    }
  }

  static std::string getCategoryString(LogCategory category) {
    switch (category) {
    case LogCategory::SYSTEM:
      return "SYSTEM";
    case LogCategory::CONFIG:
      return "CONFIG";
    case LogCategory::GENERATION:
      return "GENERATION";
    case LogCategory::VALIDATION:
      return "VALIDATION";
    case LogCategory::EXECUTION:
      return "EXECUTION";
    case LogCategory::SANDBOX:
      return "SANDBOX";
    case LogCategory::CAPABILITY:
      return "CAPABILITY";
    case LogCategory::STORE:
      return "STORE";
    case LogCategory::SERVICE:
      return "SERVICE";
    case LogCategory::DATABASE:
      return "DATABASE";
    default:
      return "UNKNOWN";
    }
  }

  static void writeLog(LogLevel level, LogCategory category,
                       const std::string &function,
                       const std::string &message);

  static LogLevel stringToLogLevel(const std::string &levelStr) {
    auto it = levelMap.find(levelStr);
    return (it != levelMap.end()) ? it->second : LogLevel::INFO;
  }

public:
  static void initialize(const LoggingSettings &settings);

  static void shutdown();

  static void debug(LogCategory category, const std::string &function,
                    const std::string &message) {
    writeLog(LogLevel::DEBUG, category, function, message);
  }

  static void info(LogCategory category, const std::string &function,
                   const std::string &message) {
    writeLog(LogLevel::INFO, category, function, message);
  }

  static void warning(LogCategory category, const std::string &function,
                      const std::string &message) {
    writeLog(LogLevel::WARNING, category, function, message);
  }

  static void error(LogCategory category, const std::string &function,
                    const std::string &message) {
    writeLog(LogLevel::ERROR, category, function, message);
  }

  static void critical(LogCategory category, const std::string &function,
                       const std::string &message) {
    writeLog(LogLevel::CRITICAL, category, function, message);
  }

  static void setLogLevel(LogLevel level);
  static void setLogLevel(const std::string &levelStr);
  static bool isEnabled(LogLevel level);
};

#endif
