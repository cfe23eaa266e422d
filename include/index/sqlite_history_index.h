#pragma once
#include <memory>

#include "index/history_index.h"
#include "utilities/sqlite_db.hpp"

namespace mailcas {

/**
 * @brief HistoryIndex stored in the `history_items` table of a SQLite file.
 *
 * Search, sort and filter are evaluated in SQL. LIKE and COLLATE NOCASE fold
 * ASCII letters only, which is the same folding the in-memory query
 * functions use, so both backends return identical orderings.
 *
 * `blob_hash` references `blobs(hash)`; the blob row must exist before a
 * record pointing at it is inserted.
 */
class SqliteHistoryIndex : public HistoryIndex {
public:
  /// Schema version written to PRAGMA user_version.
  static constexpr int SCHEMA_VERSION = 3;

  /**
   * @param db Shared connection; the blobs table is created by
   * SqliteBlobTable on the same connection.
   * @param uniqueBlobHash Enforce one record per blob hash with a UNIQUE
   * index.
   * @throws IndexError if the schema cannot be created, e.g. the file holds
   * duplicate hashes and @p uniqueBlobHash is requested, or the file carries a
   * schema version other than SCHEMA_VERSION.
   */
  SqliteHistoryIndex(std::shared_ptr<SqliteDatabase> db, bool uniqueBlobHash);

  int64_t insert(const HistoryRecord &record) override;
  std::optional<HistoryRecord> getById(int64_t id) const override;
  bool updateLastAccessed(int64_t id, int64_t timestamp) override;
  bool deleteById(int64_t id) override;
  size_t deleteAll() override;
  size_t countByBlobHash(const std::string &hash) const override;
  RecordList findByBlobHash(const std::string &hash) const override;
  size_t count() const override;
  RecordList all() const override;
  RecordList recent(size_t limit) const override;
  RecordList oldest(size_t n) const override;

  RecordList search(const std::string &text) const override;
  RecordList sortBy(SortField field, SortDirection direction) const override;
  RecordList filter(const EmailFilter &filter) const override;
  RecordList query(const HistoryQuery &q) const override;

private:
  void createSchema(bool uniqueBlobHash);
  int schemaVersion() const;
  RecordList select(const std::string &whereAndOrder) const;

  std::shared_ptr<SqliteDatabase> db_;
};

} // namespace mailcas
