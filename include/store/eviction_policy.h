#pragma once
#ifndef MAILCAS_EVICTION_POLICY_H
#define MAILCAS_EVICTION_POLICY_H

#include <cstdint>

#include "index/history_index.h"
#include "store/blob_ledger.hpp"

namespace mailcas {

/**
 * @brief Bounded retention: keep at most `limit` history records.
 *
 * Records are evicted strictly in lastAccessed order, oldest first, and only
 * as many as needed to bring the count down to the limit.
 */
class EvictionPolicy {
public:
  /// @param limit Maximum record count; 0 or less disables eviction.
  explicit EvictionPolicy(int64_t limit = 0) : limit_(limit) {}

  bool enabled() const { return limit_ > 0; }
  int64_t limit() const { return limit_; }

  /**
   * @brief Evict until index.count() <= limit.
   *
   * Each evicted record is removed from @p index first, then its blob
   * reference is dropped in @p ledger (removing the file at refcount 0).
   * @return The evicted records, oldest first.
   */
  RecordList enforce(HistoryIndex &index, BlobLedger &ledger) const;

private:
  int64_t limit_;
};

} // namespace mailcas

#endif // MAILCAS_EVICTION_POLICY_H
