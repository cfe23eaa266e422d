#ifndef MAILCAS_BLOB_TABLE_HPP
#define MAILCAS_BLOB_TABLE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "store/records.h"
#include "utilities/sqlite_db.hpp"

namespace mailcas {

/**
 * @brief Persistence of BlobRecords keyed by hash.
 *
 * Plain row storage; refcount rules live in BlobLedger.
 */
class BlobTable {
public:
  virtual ~BlobTable() = default;

  virtual std::optional<BlobRecord> find(const std::string &hash) const = 0;
  /// @throws IndexError if a row for the hash already exists.
  virtual void insert(const BlobRecord &record) = 0;
  /// @return false if no row has @p hash.
  virtual bool setRefCount(const std::string &hash, uint32_t refCount) = 0;
  /// @return false if no row has @p hash.
  virtual bool erase(const std::string &hash) = 0;
  /// All rows ordered by hash.
  virtual std::vector<BlobRecord> all() const = 0;
  virtual void clear() = 0;
  virtual uint64_t totalSizeBytes() const = 0;
};

class MemoryBlobTable : public BlobTable {
public:
  std::optional<BlobRecord> find(const std::string &hash) const override;
  void insert(const BlobRecord &record) override;
  bool setRefCount(const std::string &hash, uint32_t refCount) override;
  bool erase(const std::string &hash) override;
  std::vector<BlobRecord> all() const override;
  void clear() override;
  uint64_t totalSizeBytes() const override;

private:
  std::map<std::string, BlobRecord> rows_;
};

/**
 * @brief BlobTable stored in the `blobs` table of a SQLite file.
 *
 * The table carries CHECK(ref_count > 0), so a zero refcount can never be
 * persisted.
 */
class SqliteBlobTable : public BlobTable {
public:
  /// @throws IndexError if the table cannot be created.
  explicit SqliteBlobTable(std::shared_ptr<SqliteDatabase> db);

  std::optional<BlobRecord> find(const std::string &hash) const override;
  void insert(const BlobRecord &record) override;
  bool setRefCount(const std::string &hash, uint32_t refCount) override;
  bool erase(const std::string &hash) override;
  std::vector<BlobRecord> all() const override;
  void clear() override;
  uint64_t totalSizeBytes() const override;

private:
  std::shared_ptr<SqliteDatabase> db_;
};

} // namespace mailcas

#endif // MAILCAS_BLOB_TABLE_HPP
