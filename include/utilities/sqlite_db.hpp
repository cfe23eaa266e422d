#ifndef MAILCAS_SQLITE_DB_HPP
#define MAILCAS_SQLITE_DB_HPP

#include <cstdint>
#include <optional>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace mailcas {

class SqliteDatabase;

/**
 * @brief Prepared statement owned for the lifetime of the object.
 *
 * Bind indexes are 1-based, column indexes 0-based, as in the C API.
 */
class Statement {
public:
  Statement(SqliteDatabase &db, const std::string &sql);
  ~Statement();
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  Statement &bind(int index, const std::string &value);
  Statement &bind(int index, int64_t value);
  Statement &bind(int index, const std::optional<std::string> &value);
  Statement &bindNull(int index);

  /**
   * @brief Advance the statement.
   * @return true while a row is available, false once done.
   * @throws IndexError on any other result code.
   */
  bool step();

  /// Step a statement that must not return rows.
  void run();

  std::string columnText(int col) const;
  std::optional<std::string> columnOptionalText(int col) const;
  int64_t columnInt64(int col) const;

  void reset();

private:
  SqliteDatabase &db_;
  sqlite3_stmt *stmt_ = nullptr;
  std::string sql_;
};

/**
 * @brief Owning handle to one SQLite database file.
 *
 * Opened read-write/create with a serialized connection, WAL journaling,
 * foreign keys on and a busy timeout.
 */
class SqliteDatabase {
public:
  /// ":memory:" opens a private in-memory database.
  explicit SqliteDatabase(const std::string &path);
  ~SqliteDatabase();
  SqliteDatabase(const SqliteDatabase &) = delete;
  SqliteDatabase &operator=(const SqliteDatabase &) = delete;

  /// Run one or more statements that return no rows.
  void exec(const std::string &sql);

  int64_t lastInsertRowId() const;
  int changes() const;
  std::string errorMessage() const;
  const std::string &path() const { return path_; }

  sqlite3 *handle() { return db_; }

  /**
   * @brief Scoped transaction; rolls back unless commit() was called.
   */
  class Transaction {
  public:
    explicit Transaction(SqliteDatabase &db);
    ~Transaction();
    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;
    void commit();

  private:
    SqliteDatabase &db_;
    bool done_ = false;
  };

private:
  sqlite3 *db_ = nullptr;
  std::string path_;
};

} // namespace mailcas

#endif // MAILCAS_SQLITE_DB_HPP
