#include "index/memory_history_index.h"
#include "utilities/errors.h"

#include <algorithm>

namespace mailcas {

MemoryHistoryIndex::MemoryHistoryIndex(bool uniqueBlobHash)
    : uniqueBlobHash_(uniqueBlobHash) {}

int64_t MemoryHistoryIndex::insert(const HistoryRecord &record) {
  if (uniqueBlobHash_ && countByBlobHash(record.blobHash) > 0) {
    throw IndexError("UNIQUE constraint failed: history_items.blob_hash (" +
                         record.blobHash + ")",
                     0);
  }
  HistoryRecord stored = record;
  stored.id = nextId_++;
  records_.emplace(stored.id, stored);
  return stored.id;
}

std::optional<HistoryRecord> MemoryHistoryIndex::getById(int64_t id) const {
  auto it = records_.find(id);
  if (it == records_.end())
    return std::nullopt;
  return it->second;
}

bool MemoryHistoryIndex::updateLastAccessed(int64_t id, int64_t timestamp) {
  auto it = records_.find(id);
  if (it == records_.end())
    return false;
  it->second.lastAccessed = timestamp;
  return true;
}

bool MemoryHistoryIndex::deleteById(int64_t id) {
  return records_.erase(id) > 0;
}

size_t MemoryHistoryIndex::deleteAll() {
  size_t removed = records_.size();
  records_.clear();
  return removed;
}

size_t MemoryHistoryIndex::countByBlobHash(const std::string &hash) const {
  return static_cast<size_t>(
      std::count_if(records_.begin(), records_.end(),
                    [&](const auto &kv) { return kv.second.blobHash == hash; }));
}

RecordList MemoryHistoryIndex::findByBlobHash(const std::string &hash) const {
  RecordList out;
  for (const auto &kv : records_) {
    if (kv.second.blobHash == hash)
      out.push_back(kv.second);
  }
  return out;
}

size_t MemoryHistoryIndex::count() const { return records_.size(); }

RecordList MemoryHistoryIndex::all() const {
  RecordList out;
  out.reserve(records_.size());
  for (const auto &kv : records_)
    out.push_back(kv.second);
  mailcas::query::orderByRecency(out);
  return out;
}

RecordList MemoryHistoryIndex::oldest(size_t n) const {
  RecordList out;
  out.reserve(records_.size());
  for (const auto &kv : records_)
    out.push_back(kv.second);
  // records_ iterates by ascending id, so a stable sort keeps lower ids first
  // among equal timestamps.
  std::stable_sort(out.begin(), out.end(),
                   [](const HistoryRecord &a, const HistoryRecord &b) {
                     return a.lastAccessed < b.lastAccessed;
                   });
  if (out.size() > n)
    out.resize(n);
  return out;
}

} // namespace mailcas
