#include "core/logger.h"
#include "core/app_config.h"
#include "core/file_log_writer.h"
#include <algorithm>
#include <iostream>

// Writers receive every formatted line that passes the level filter. Until
// initialize() runs only the console writer is installed, so early messages
// (configuration loading, tests) still reach stderr.
std::vector<std::unique_ptr<ILogWriter>> Logger::writers_ = [] {
  std::vector<std::unique_ptr<ILogWriter>> writers;
  writers.push_back(std::make_unique<ConsoleLogWriter>());
  return writers;
}();
std::unique_ptr<DatabaseLogWriter> Logger::dbWriter_;
std::mutex Logger::logMutex;

LogLevel Logger::currentLogLevel = LogLevel::INFO;
bool Logger::showTimestamps = true;
std::mutex Logger::configMutex;

const std::unordered_map<std::string, LogLevel> Logger::levelMap = {
    {"DEBUG", LogLevel::DEBUG},      {"INFO", LogLevel::INFO},
    {"WARN", LogLevel::WARNING},     {"WARNING", LogLevel::WARNING},
    {"ERROR", LogLevel::ERROR},      {"FATAL", LogLevel::CRITICAL},
    {"CRITICAL", LogLevel::CRITICAL}};

void Logger::writeLog(LogLevel level, LogCategory category,
                      const std::string &function,
                      const std::string &message) {
  bool withTimestamp;
  {
    std::lock_guard<std::mutex> configLock(configMutex);
    if (level < currentLogLevel) {
      return;
    }
    withTimestamp = showTimestamps;
  }

  std::string levelStr = getLevelString(level);
  std::string categoryStr = getCategoryString(category);
  std::string formatted =
      formatLogMessage(withTimestamp ? getCurrentTimestamp() : "", levelStr,
                       categoryStr, function, message);

  DatabaseLogWriter *writer = nullptr;
  {
    std::lock_guard<std::mutex> lock(logMutex);
    for (auto &sink : writers_) {
      if (sink->isOpen()) {
        sink->write(formatted);
      }
    }
    if (dbWriter_ && dbWriter_->isEnabled()) {
      writer = dbWriter_.get();
    }
  }

  if (writer) {
    writer->writeParsed(levelStr, categoryStr, function, message);
  }
}

// Installs the sinks described by the logging settings: console always, a
// rotating file when `file` is set, PostgreSQL when the database section is
// enabled. A sink that cannot be opened is reported on stderr and skipped.
void Logger::initialize(const LoggingSettings &settings) {
  setLogLevel(settings.level);

  std::vector<std::unique_ptr<ILogWriter>> writers;
  writers.push_back(std::make_unique<ConsoleLogWriter>());

  if (!settings.file.empty()) {
    auto fileWriter = std::make_unique<FileLogWriter>(
        settings.file, settings.max_file_size_mb * 1024 * 1024,
        settings.max_backup_files);
    if (fileWriter->isOpen()) {
      writers.push_back(std::move(fileWriter));
    } else {
      std::cerr << "Warning: could not open log file '" << settings.file
                << "', file logging disabled" << std::endl;
    }
  }

  std::unique_ptr<DatabaseLogWriter> dbWriter;
  if (settings.database.enabled) {
    try {
      dbWriter = std::make_unique<DatabaseLogWriter>(
          settings.database.connectionString());
      if (!dbWriter->isEnabled()) {
        std::cerr << "Warning: Database log writer initialization failed. "
                     "Logging to database will be disabled."
                  << std::endl;
        dbWriter.reset();
      }
    } catch (const std::exception &e) {
      std::cerr << "Error initializing database log writer: " << e.what()
                << std::endl;
      dbWriter.reset();
    }
  }

  std::lock_guard<std::mutex> lock(logMutex);
  for (auto &sink : writers_) {
    sink->flush();
  }
  writers_ = std::move(writers);
  dbWriter_ = std::move(dbWriter);
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(logMutex);
  for (auto &sink : writers_) {
    sink->flush();
    sink->close();
  }
  writers_.clear();
  writers_.push_back(std::make_unique<ConsoleLogWriter>());
  if (dbWriter_) {
    dbWriter_->close();
  }
  dbWriter_.reset();
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex);
  currentLogLevel = level;
}

// Accepts DEBUG, INFO, WARN/WARNING, ERROR, FATAL/CRITICAL in any case.
// Anything else leaves the current level untouched.
void Logger::setLogLevel(const std::string &levelStr) {
  if (levelStr.empty()) {
    return;
  }

  std::string upperLevelStr = levelStr;
  std::transform(upperLevelStr.begin(), upperLevelStr.end(),
                 upperLevelStr.begin(), ::toupper);

  if (levelMap.find(upperLevelStr) == levelMap.end()) {
    return;
  }

  setLogLevel(stringToLogLevel(upperLevelStr));
}

bool Logger::isEnabled(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex);
  return level >= currentLogLevel;
}
