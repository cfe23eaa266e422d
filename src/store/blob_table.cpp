#include "store/blob_table.hpp"
#include "utilities/errors.h"

namespace mailcas {

std::optional<BlobRecord>
MemoryBlobTable::find(const std::string &hash) const {
  auto it = rows_.find(hash);
  if (it == rows_.end())
    return std::nullopt;
  return it->second;
}

void MemoryBlobTable::insert(const BlobRecord &record) {
  if (!rows_.emplace(record.hash, record).second) {
    throw IndexError("Blob row already exists: " + record.hash, 0);
  }
}

bool MemoryBlobTable::setRefCount(const std::string &hash, uint32_t refCount) {
  auto it = rows_.find(hash);
  if (it == rows_.end())
    return false;
  it->second.refCount = refCount;
  return true;
}

bool MemoryBlobTable::erase(const std::string &hash) {
  return rows_.erase(hash) > 0;
}

std::vector<BlobRecord> MemoryBlobTable::all() const {
  std::vector<BlobRecord> out;
  out.reserve(rows_.size());
  for (const auto &kv : rows_)
    out.push_back(kv.second);
  return out;
}

void MemoryBlobTable::clear() { rows_.clear(); }

uint64_t MemoryBlobTable::totalSizeBytes() const {
  uint64_t total = 0;
  for (const auto &kv : rows_)
    total += kv.second.sizeBytes;
  return total;
}

namespace {

BlobRecord readBlob(const Statement &st) {
  BlobRecord b;
  b.hash = st.columnText(0);
  b.sizeBytes = static_cast<uint64_t>(st.columnInt64(1));
  b.refCount = static_cast<uint32_t>(st.columnInt64(2));
  return b;
}

} // namespace

SqliteBlobTable::SqliteBlobTable(std::shared_ptr<SqliteDatabase> db)
    : db_(std::move(db)) {
  db_->exec("CREATE TABLE IF NOT EXISTS blobs ("
            "hash TEXT PRIMARY KEY NOT NULL, "
            "size_bytes INTEGER NOT NULL CHECK(size_bytes >= 0), "
            "ref_count INTEGER NOT NULL CHECK(ref_count > 0))");
}

std::optional<BlobRecord>
SqliteBlobTable::find(const std::string &hash) const {
  Statement st(*db_,
               "SELECT hash, size_bytes, ref_count FROM blobs WHERE hash = ?");
  st.bind(1, hash);
  if (!st.step())
    return std::nullopt;
  return readBlob(st);
}

void SqliteBlobTable::insert(const BlobRecord &record) {
  Statement st(*db_, "INSERT INTO blobs (hash, size_bytes, ref_count) "
                     "VALUES (?, ?, ?)");
  st.bind(1, record.hash)
      .bind(2, static_cast<int64_t>(record.sizeBytes))
      .bind(3, static_cast<int64_t>(record.refCount));
  st.run();
}

bool SqliteBlobTable::setRefCount(const std::string &hash, uint32_t refCount) {
  Statement st(*db_, "UPDATE blobs SET ref_count = ? WHERE hash = ?");
  st.bind(1, static_cast<int64_t>(refCount)).bind(2, hash);
  st.run();
  return db_->changes() > 0;
}

bool SqliteBlobTable::erase(const std::string &hash) {
  Statement st(*db_, "DELETE FROM blobs WHERE hash = ?");
  st.bind(1, hash);
  st.run();
  return db_->changes() > 0;
}

std::vector<BlobRecord> SqliteBlobTable::all() const {
  Statement st(*db_,
               "SELECT hash, size_bytes, ref_count FROM blobs ORDER BY hash");
  std::vector<BlobRecord> out;
  while (st.step())
    out.push_back(readBlob(st));
  return out;
}

void SqliteBlobTable::clear() { db_->exec("DELETE FROM blobs"); }

uint64_t SqliteBlobTable::totalSizeBytes() const {
  Statement st(*db_, "SELECT COALESCE(SUM(size_bytes), 0) FROM blobs");
  if (!st.step())
    return 0;
  return static_cast<uint64_t>(st.columnInt64(0));
}

} // namespace mailcas
