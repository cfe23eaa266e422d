#pragma once
#ifndef MAILCAS_HISTORY_SNAPSHOT_H
#define MAILCAS_HISTORY_SNAPSHOT_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "index/history_query.hpp"
#include "store/records.h"

namespace mailcas {

/**
 * @brief Immutable point-in-time copy of the whole store.
 *
 * Built after each committed mutation and shared read-only between threads;
 * no method touches the backing storage.
 */
class HistorySnapshot {
public:
  HistorySnapshot() = default;

  /// @param records Every record, most recently accessed first.
  HistorySnapshot(RecordList records, const std::vector<BlobRecord> &blobs,
                  uint64_t version);

  /// Monotonic commit counter; 0 for the snapshot taken at construction.
  uint64_t version() const { return version_; }

  const RecordList &records() const { return records_; }
  size_t size() const { return records_.size(); }
  bool empty() const { return records_.empty(); }

  std::optional<HistoryRecord> get(int64_t id) const;
  RecordList recent(size_t limit) const;

  RecordList search(const std::string &text) const;
  RecordList sortBy(SortField field, SortDirection direction) const;
  RecordList filter(const EmailFilter &filter) const;
  RecordList query(const HistoryQuery &q) const;

  std::optional<BlobRecord> blob(const std::string &hash) const;
  const std::map<std::string, BlobRecord> &blobs() const { return blobs_; }

  const CacheStats &cacheStats() const { return stats_; }

private:
  RecordList records_;
  std::map<int64_t, size_t> byId_;
  std::map<std::string, BlobRecord> blobs_;
  CacheStats stats_;
  uint64_t version_ = 0;
};

} // namespace mailcas

#endif // MAILCAS_HISTORY_SNAPSHOT_H
