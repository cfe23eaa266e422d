#include "store/blob_ledger.hpp"
#include "utilities/errors.h"
#include "utilities/logger.h"

#include <limits>

namespace mailcas {

BlobLedger::BlobLedger(ContentStore &store, BlobTable &table)
    : store_(store), table_(table) {}

std::optional<BlobRecord> BlobLedger::lookup(const std::string &hash) const {
  return table_.find(hash);
}

BlobRecord BlobLedger::create(const std::string &hash, uint64_t sizeBytes) {
  if (table_.find(hash)) {
    throw LedgerInvariantError("Blob already in ledger: " + hash);
  }
  BlobRecord record{hash, sizeBytes, 1};
  table_.insert(record);
  return record;
}

uint32_t BlobLedger::incrementRef(const std::string &hash) {
  auto record = table_.find(hash);
  if (!record) {
    throw LedgerInvariantError("incrementRef on unknown blob " + hash);
  }
  if (record->refCount == std::numeric_limits<uint32_t>::max()) {
    throw LedgerInvariantError("Refcount overflow for blob " + hash);
  }
  const uint32_t next = record->refCount + 1;
  table_.setRefCount(hash, next);
  return next;
}

uint32_t BlobLedger::decrementRef(const std::string &hash) {
  auto record = table_.find(hash);
  if (!record) {
    throw LedgerInvariantError("decrementRef on unknown blob " + hash);
  }
  if (record->refCount == 0) {
    throw LedgerInvariantError("Blob " + hash + " has refcount 0 in ledger");
  }
  const uint32_t remaining = record->refCount - 1;
  if (remaining > 0) {
    table_.setRefCount(hash, remaining);
    return remaining;
  }
  table_.erase(hash);
  pending_.push_back(hash);
  return 0;
}

std::vector<BlobRecord> BlobLedger::all() const { return table_.all(); }

uint64_t BlobLedger::totalSizeBytes() const { return table_.totalSizeBytes(); }

void BlobLedger::clear() {
  table_.clear();
  pending_.clear();
  sweepPending_ = true;
}

size_t BlobLedger::releasePending() {
  size_t removed = 0;
  if (sweepPending_) {
    sweepPending_ = false;
    try {
      removed += store_.removeAll();
      Logger::getInstance().log(LogLevel::INFO,
                                "[BlobLedger] Cleared ledger, " +
                                    std::to_string(removed) +
                                    " blob files removed");
    } catch (const StoreError &e) {
      Logger::getInstance().log(LogLevel::ERROR,
                                std::string("[BlobLedger] Blob sweep after "
                                            "clear incomplete, leftovers "
                                            "await garbage collection: ") +
                                    e.what());
    }
  }

  std::vector<std::string> queued;
  queued.swap(pending_);
  for (const auto &hash : queued) {
    try {
      if (store_.remove(hash)) {
        ++removed;
      } else {
        Logger::getInstance().log(LogLevel::WARN,
                                  "[BlobLedger] Blob file already missing: " +
                                      hash);
      }
    } catch (const StoreError &e) {
      Logger::getInstance().log(LogLevel::ERROR,
                                "[BlobLedger] Blob file " + hash +
                                    " left for garbage collection: " +
                                    e.what());
    }
  }
  return removed;
}

void BlobLedger::discardPending() {
  pending_.clear();
  sweepPending_ = false;
}

} // namespace mailcas
