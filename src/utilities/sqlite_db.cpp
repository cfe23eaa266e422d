#include "utilities/sqlite_db.hpp"
#include "utilities/errors.h"
#include "utilities/logger.h"

#include <sqlite3.h>

namespace mailcas {

SqliteDatabase::SqliteDatabase(const std::string &path) : path_(path) {
  int rc = sqlite3_open_v2(path.c_str(), &db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                               SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw IndexError("Failed to open DB " + path + ": " + msg, rc);
  }

  try {
    if (path != ":memory:")
      exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=FULL;");
    exec("PRAGMA foreign_keys=ON;");
    exec("PRAGMA busy_timeout=5000;");
  } catch (const IndexError &) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDatabase::~SqliteDatabase() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void SqliteDatabase::exec(const std::string &sql) {
  char *err = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw IndexError("SQLite exec failed: " + msg, rc);
  }
}

int64_t SqliteDatabase::lastInsertRowId() const {
  return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
}

int SqliteDatabase::changes() const { return sqlite3_changes(db_); }

std::string SqliteDatabase::errorMessage() const { return sqlite3_errmsg(db_); }

SqliteDatabase::Transaction::Transaction(SqliteDatabase &db) : db_(db) {
  db_.exec("BEGIN IMMEDIATE;");
}

SqliteDatabase::Transaction::~Transaction() {
  if (done_)
    return;
  char *err = nullptr;
  if (sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, &err) !=
      SQLITE_OK) {
    // Destructors cannot throw; the failed rollback is reported instead.
    Logger::getInstance().log(LogLevel::ERROR,
                              std::string("[SqliteDatabase] ROLLBACK failed: ") +
                                  (err ? err : "unknown error"));
    sqlite3_free(err);
  }
}

void SqliteDatabase::Transaction::commit() {
  db_.exec("COMMIT;");
  done_ = true;
}

Statement::Statement(SqliteDatabase &db, const std::string &sql)
    : db_(db), sql_(sql) {
  int rc = sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    throw IndexError("prepare failed: " + db_.errorMessage() + " [" + sql + "]",
                     rc);
  }
}

Statement::~Statement() { sqlite3_finalize(stmt_); }

Statement &Statement::bind(int index, const std::string &value) {
  int rc = sqlite3_bind_text(stmt_, index, value.c_str(),
                             static_cast<int>(value.size()), SQLITE_TRANSIENT);
  if (rc != SQLITE_OK)
    throw IndexError("bind failed: " + db_.errorMessage(), rc);
  return *this;
}

Statement &Statement::bind(int index, int64_t value) {
  int rc = sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
  if (rc != SQLITE_OK)
    throw IndexError("bind failed: " + db_.errorMessage(), rc);
  return *this;
}

Statement &Statement::bind(int index, const std::optional<std::string> &value) {
  return value ? bind(index, *value) : bindNull(index);
}

Statement &Statement::bindNull(int index) {
  int rc = sqlite3_bind_null(stmt_, index);
  if (rc != SQLITE_OK)
    throw IndexError("bind failed: " + db_.errorMessage(), rc);
  return *this;
}

bool Statement::step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW)
    return true;
  if (rc == SQLITE_DONE)
    return false;
  throw IndexError("step failed: " + db_.errorMessage() + " [" + sql_ + "]",
                   rc);
}

void Statement::run() {
  if (step()) {
    throw IndexError("statement unexpectedly returned rows [" + sql_ + "]",
                     SQLITE_MISUSE);
  }
}

std::string Statement::columnText(int col) const {
  const unsigned char *txt = sqlite3_column_text(stmt_, col);
  if (!txt)
    return std::string();
  return std::string(reinterpret_cast<const char *>(txt),
                     static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

std::optional<std::string> Statement::columnOptionalText(int col) const {
  if (sqlite3_column_type(stmt_, col) == SQLITE_NULL)
    return std::nullopt;
  return columnText(col);
}

int64_t Statement::columnInt64(int col) const {
  return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

void Statement::reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

} // namespace mailcas
