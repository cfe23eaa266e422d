#pragma once
#ifndef MAILCAS_HISTORY_STORE_H
#define MAILCAS_HISTORY_STORE_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "index/history_index.h"
#include "index/history_snapshot.h"
#include "store/blob_ledger.hpp"
#include "store/blob_table.hpp"
#include "store/content_store.hpp"
#include "store/eviction_policy.h"
#include "store/records.h"
#include "utilities/clock.h"
#include "utilities/sqlite_db.hpp"
#include "utilities/store_config.hpp"

namespace mailcas {

struct HistoryStoreOptions {
  DedupPolicy dedupPolicy = DedupPolicy::UniquePerContent;
  /// Retention bound; 0 or less keeps every record.
  int64_t historyLimit = 0;
};

/**
 * @brief Content-addressed email history: blobs, refcounts and the index.
 *
 * All mutations (ingest, access, remove, clearAll, eviction, GC) are
 * serialized by one mutation lock. After each commit an immutable
 * HistorySnapshot is published; every read method answers from the current
 * snapshot and never blocks on a running mutation.
 *
 * One instance owns its base directory. Construct it once and pass it to
 * whoever needs it.
 */
class HistoryStore {
public:
  using SnapshotPtr = std::shared_ptr<const HistorySnapshot>;
  using Observer = std::function<void(const SnapshotPtr &)>;
  using SubscriptionId = uint64_t;

  /**
   * @param db Connection shared by @p blobs and @p index when they are SQLite
   * backed, so each mutation commits as one transaction. May be null.
   */
  HistoryStore(std::unique_ptr<ContentStore> contents,
               std::unique_ptr<BlobTable> blobs,
               std::unique_ptr<HistoryIndex> index,
               std::shared_ptr<const Clock> clock,
               HistoryStoreOptions options = {},
               std::shared_ptr<SqliteDatabase> db = nullptr);

  HistoryStore(const HistoryStore &) = delete;
  HistoryStore &operator=(const HistoryStore &) = delete;

  /**
   * @brief Build a store from configuration.
   *
   * Initializes the Logger when config.logFile is set and creates the base
   * directory layout.
   * @throws IOFailure, IndexError
   */
  static std::unique_ptr<HistoryStore> open(const StoreConfig &config);

  /**
   * @brief Store @p bytes and return the history record for them.
   *
   * Unknown content is written to cas/ before any ledger row or record
   * refers to it. Known content either bumps the existing record's
   * lastAccessed (UniquePerContent) or adds another record sharing the blob
   * (SharedReferences). Eviction runs afterwards.
   *
   * @param displayName Blank names are stored as "Untitled".
   * @throws IOFailure if the bytes cannot be written; nothing is created.
   */
  HistoryRecord ingest(std::span<const std::byte> bytes,
                       const std::string &displayName,
                       const std::optional<std::string> &sourceRef = std::nullopt,
                       const std::optional<EmailMetadata> &metadata = std::nullopt);

  /// Bump lastAccessed. @return The updated record, or nullopt for an unknown id.
  std::optional<HistoryRecord> access(int64_t id);

  /**
   * @brief Delete a record and drop its blob reference.
   * @return false if @p id was already absent.
   */
  bool remove(int64_t id);

  /// Delete every record and every blob file.
  void clearAll();

  CacheStats getCacheStats() const;

  std::optional<HistoryRecord> get(int64_t id) const;
  RecordList recent(size_t limit) const;
  RecordList search(const std::string &text) const;
  RecordList sortBy(SortField field, SortDirection direction) const;
  RecordList filter(const EmailFilter &filter) const;
  RecordList query(const HistoryQuery &q) const;

  /// Path of the stored payload, or nullopt if no such blob is registered.
  std::optional<std::string> blobPath(const std::string &hash) const;
  std::optional<std::vector<std::byte>> readBlob(const std::string &hash) const;
  std::optional<BlobRecord> blobMeta(const std::string &hash) const;

  SnapshotPtr snapshot() const;

  /**
   * @brief Register an observer.
   *
   * @p observer is called at once with the current snapshot and then after
   * every commit, in commit order, while the mutation lock is held. It must
   * not call mutating methods of this store.
   */
  SubscriptionId subscribe(Observer observer);
  void unsubscribe(SubscriptionId id);

  /**
   * @brief Remove cas/ files that no ledger row references.
   * @param dryRun Only report what would be removed.
   */
  ContentStore::GCStats collectGarbage(bool dryRun = false);

  const HistoryStoreOptions &options() const { return options_; }

private:
  HistoryRecord ingestLocked(const std::string &hash,
                             std::span<const std::byte> bytes,
                             const std::string &displayName,
                             const std::optional<std::string> &sourceRef,
                             const std::optional<EmailMetadata> &metadata);
  HistoryRecord touchExisting(const std::string &hash, int64_t now);
  void enforceLimit();
  void rollbackLocked(std::optional<SqliteDatabase::Transaction> &tx);
  void publishLocked();
  void updateMetrics(const HistorySnapshot &snap) const;

  std::unique_ptr<ContentStore> contents_;
  std::unique_ptr<BlobTable> blobs_;
  std::unique_ptr<HistoryIndex> index_;
  std::shared_ptr<const Clock> clock_;
  HistoryStoreOptions options_;
  std::shared_ptr<SqliteDatabase> db_;
  BlobLedger ledger_;
  EvictionPolicy eviction_;

  mutable std::mutex mutationMutex_;
  uint64_t version_ = 0;
  std::map<SubscriptionId, Observer> observers_;
  SubscriptionId nextSubscription_ = 1;

  mutable std::mutex snapshotMutex_;
  SnapshotPtr snapshot_;
};

} // namespace mailcas

#endif // MAILCAS_HISTORY_STORE_H
