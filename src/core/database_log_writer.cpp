#include "core/database_log_writer.h"
#include "utils/string_utils.h"
#include <iostream>

namespace {
constexpr size_t MAX_LEVEL_LENGTH = 16;
constexpr size_t MAX_CATEGORY_LENGTH = 32;
constexpr size_t MAX_FUNCTION_LENGTH = 255;
constexpr size_t MAX_MESSAGE_LENGTH = 10000;
} // namespace

DatabaseLogWriter::DatabaseLogWriter(const std::string &connectionString)
    : connectionString_(connectionString), statementPrepared_(false),
      enabled_(true) {
  try {
    conn_ = std::make_unique<pqxx::connection>(connectionString_);
    std::lock_guard<std::mutex> lock(mutex_);
    prepareStatementUnlocked();
  } catch (const std::exception &e) {
    enabled_ = false;
    std::cerr << "DatabaseLogWriter: Failed to establish connection: "
              << e.what() << std::endl;
  }
}

// Creates the log table when needed and prepares the insert statement. Any
// failure disables the writer; the console sink keeps working regardless.
void DatabaseLogWriter::prepareStatementUnlocked() {
  if (!conn_ || !conn_->is_open() || statementPrepared_)
    return;

  try {
    pqxx::work w(*conn_);
    w.exec("CREATE SCHEMA IF NOT EXISTS flowforge");
    w.exec("CREATE TABLE IF NOT EXISTS flowforge.service_logs ("
           "id BIGSERIAL PRIMARY KEY, ts TIMESTAMPTZ NOT NULL DEFAULT NOW(), "
           "level VARCHAR(16) NOT NULL, category VARCHAR(32) NOT NULL, "
           "function VARCHAR(255), message TEXT NOT NULL)");
    w.commit();
    conn_->prepare("service_log_insert",
                   "INSERT INTO flowforge.service_logs (ts, level, category, "
                   "function, message) VALUES (NOW(), $1, $2, $3, $4)");
    statementPrepared_ = true;
  } catch (const std::exception &e) {
    enabled_ = false;
    std::cerr << "DatabaseLogWriter: Failed to prepare statement: " << e.what()
              << std::endl;
  }
}

// Pre-formatted lines carry no structure worth storing; the Logger always
// calls writeParsed() for this sink.
bool DatabaseLogWriter::write(const std::string &) { return false; }

bool DatabaseLogWriter::writeParsed(const std::string &levelStr,
                                    const std::string &categoryStr,
                                    const std::string &function,
                                    const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!enabled_ || !conn_ || !conn_->is_open()) {
    if (conn_ && !conn_->is_open()) {
      enabled_ = false;
    }
    return false;
  }

  if (levelStr.length() > MAX_LEVEL_LENGTH ||
      categoryStr.length() > MAX_CATEGORY_LENGTH) {
    return false;
  }

  try {
    if (!statementPrepared_) {
      prepareStatementUnlocked();
      if (!statementPrepared_)
        return false;
    }

    std::string sanitizedFunction = StringUtils::sanitizeUTF8(function);
    if (sanitizedFunction.length() > MAX_FUNCTION_LENGTH) {
      sanitizedFunction.resize(MAX_FUNCTION_LENGTH);
    }
    std::string sanitizedMessage = StringUtils::sanitizeUTF8(
        StringUtils::truncate(message, MAX_MESSAGE_LENGTH));

    pqxx::work txn(*conn_);
    txn.exec_prepared("service_log_insert", levelStr, categoryStr,
                      sanitizedFunction, sanitizedMessage);
    txn.commit();
    return true;
  } catch (const pqxx::broken_connection &e) {
    enabled_ = false;
    conn_.reset();
    std::cerr << "DatabaseLogWriter: Connection broken: " << e.what()
              << std::endl;
    return false;
  } catch (const pqxx::sql_error &e) {
    std::cerr << "DatabaseLogWriter: SQL error writing log entry: " << e.what()
              << std::endl;
    return false;
  } catch (const std::exception &e) {
    std::cerr << "DatabaseLogWriter: Failed to write log entry: " << e.what()
              << std::endl;
    return false;
  }
}

void DatabaseLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  conn_.reset();
  enabled_ = false;
}

bool DatabaseLogWriter::isEnabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return enabled_;
}

bool DatabaseLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return conn_ && conn_->is_open() && enabled_;
}
