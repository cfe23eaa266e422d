#include "store/history_store.h"
#include "index/memory_history_index.h"
#include "index/sqlite_history_index.h"
#include "utilities/content_hasher.hpp"
#include "utilities/errors.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/store_paths.hpp"
#include "utilities/text_utils.hpp"

#include <filesystem>
#include <unordered_set>

namespace mailcas {

namespace {

const char *ingestResultLabel(bool newBlob, DedupPolicy policy) {
  if (newBlob)
    return "new";
  return policy == DedupPolicy::UniquePerContent ? "dedup" : "shared";
}

} // namespace

HistoryStore::HistoryStore(std::unique_ptr<ContentStore> contents,
                           std::unique_ptr<BlobTable> blobs,
                           std::unique_ptr<HistoryIndex> index,
                           std::shared_ptr<const Clock> clock,
                           HistoryStoreOptions options,
                           std::shared_ptr<SqliteDatabase> db)
    : contents_(std::move(contents)), blobs_(std::move(blobs)),
      index_(std::move(index)), clock_(std::move(clock)), options_(options),
      db_(std::move(db)), ledger_(*contents_, *blobs_),
      eviction_(options.historyLimit) {
  std::lock_guard<std::mutex> lock(mutationMutex_);
  publishLocked();
}

std::unique_ptr<HistoryStore> HistoryStore::open(const StoreConfig &config) {
  if (!config.logFile.empty()) {
    Logger::init(config.logFile, config.logLevel);
  }
  StorePaths paths(config.baseDir.empty() ? defaultBaseDir() : config.baseDir);
  std::error_code ec;
  std::filesystem::create_directories(paths.baseDir(), ec);
  if (ec) {
    throw IOFailure("Cannot create base directory: " + ec.message(),
                    paths.baseDir());
  }

  const bool unique = config.dedupPolicy == DedupPolicy::UniquePerContent;
  auto contents =
      std::make_unique<ContentStore>(paths.casDir(), config.durableWrites);
  std::shared_ptr<SqliteDatabase> db;
  std::unique_ptr<BlobTable> blobs;
  std::unique_ptr<HistoryIndex> index;
  if (config.indexBackend == IndexBackend::Sqlite) {
    db = std::make_shared<SqliteDatabase>(paths.indexDbPath());
    // blobs first: history_items references it.
    blobs = std::make_unique<SqliteBlobTable>(db);
    index = std::make_unique<SqliteHistoryIndex>(db, unique);
  } else {
    blobs = std::make_unique<MemoryBlobTable>();
    index = std::make_unique<MemoryHistoryIndex>(unique);
  }

  HistoryStoreOptions options;
  options.dedupPolicy = config.dedupPolicy;
  options.historyLimit = config.historyLimit;

  auto store = std::make_unique<HistoryStore>(
      std::move(contents), std::move(blobs), std::move(index),
      std::make_shared<SystemClock>(), options, db);
  Logger::getInstance().log(
      LogLevel::INFO, "[HistoryStore] Opened " + paths.baseDir() +
                          " (backend=" + toString(config.indexBackend) +
                          ", policy=" + toString(config.dedupPolicy) +
                          ", limit=" + std::to_string(config.historyLimit) +
                          ", entries=" +
                          std::to_string(store->getCacheStats().entryCount) +
                          ")");
  return store;
}

HistoryRecord
HistoryStore::ingest(std::span<const std::byte> bytes,
                     const std::string &displayName,
                     const std::optional<std::string> &sourceRef,
                     const std::optional<EmailMetadata> &metadata) {
  // Hashing touches no shared state, so it runs outside the lock.
  const std::string hash = ContentHasher::sha256_hex(bytes);

  std::lock_guard<std::mutex> lock(mutationMutex_);
  HistoryRecord record =
      ingestLocked(hash, bytes, displayName, sourceRef, metadata);
  try {
    enforceLimit();
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              std::string("[HistoryStore] Eviction failed: ") +
                                  e.what());
    // The ingest itself is committed; readers must still see it.
    publishLocked();
    throw;
  }
  publishLocked();
  MetricsRegistry::instance().observe("mailcas_ingest_bytes",
                                      static_cast<double>(bytes.size()));
  return record;
}

HistoryRecord HistoryStore::touchExisting(const std::string &hash,
                                          int64_t now) {
  RecordList existing = index_->findByBlobHash(hash);
  if (existing.empty()) {
    throw LedgerInvariantError("Blob " + hash +
                               " is in the ledger but no record references it");
  }
  HistoryRecord record = existing.front();
  index_->updateLastAccessed(record.id, now);
  record.lastAccessed = now;
  return record;
}

HistoryRecord
HistoryStore::ingestLocked(const std::string &hash,
                           std::span<const std::byte> bytes,
                           const std::string &displayName,
                           const std::optional<std::string> &sourceRef,
                           const std::optional<EmailMetadata> &metadata) {
  const int64_t now = clock_->nowMillis();
  const auto known = ledger_.lookup(hash);
  auto &metrics = MetricsRegistry::instance();

  if (known && options_.dedupPolicy == DedupPolicy::UniquePerContent) {
    HistoryRecord record = touchExisting(hash, now);
    metrics.incrementCounter("mailcas_ingest_total", 1.0,
                             {{"result", ingestResultLabel(false, options_.dedupPolicy)}});
    Logger::getInstance().log(LogLevel::DEBUG,
                              "[HistoryStore] Re-ingest of " + hash +
                                  " touched record " +
                                  std::to_string(record.id));
    return record;
  }

  HistoryRecord record;
  record.blobHash = hash;
  record.displayName = text::isBlank(displayName) ? UNTITLED : displayName;
  record.originalSourceRef = sourceRef;
  record.lastAccessed = now;
  record.applyMetadata(metadata.value_or(EmailMetadata{}));

  std::optional<SqliteDatabase::Transaction> tx;
  if (db_)
    tx.emplace(*db_);

  bool wroteFile = false;
  bool ledgerTouched = false;
  std::optional<int64_t> insertedId;
  try {
    if (!known) {
      // The bytes are on disk before anything can refer to them.
      wroteFile = contents_->put(hash, bytes);
      ledger_.create(hash, bytes.size());
    } else {
      ledger_.incrementRef(hash);
    }
    ledgerTouched = true;
    insertedId = index_->insert(record);
    record.id = *insertedId;
    if (tx)
      tx->commit();
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, "[HistoryStore] Ingest of " +
                                                   hash + " failed: " +
                                                   e.what());
    try {
      if (!tx) {
        if (insertedId)
          index_->deleteById(*insertedId);
        if (ledgerTouched) {
          // A new blob drops back to zero and its file is released below.
          ledger_.decrementRef(hash);
          wroteFile = false;
        }
      }
      rollbackLocked(tx);
      if (wroteFile)
        contents_->remove(hash);
    } catch (const std::exception &rollbackError) {
      Logger::getInstance().log(LogLevel::ERROR,
                                "[HistoryStore] Rollback after failed ingest "
                                "of " + hash + " failed: " +
                                    rollbackError.what());
    }
    throw;
  }

  metrics.incrementCounter("mailcas_ingest_total", 1.0,
                           {{"result", ingestResultLabel(!known, options_.dedupPolicy)}});
  Logger::getInstance().log(LogLevel::DEBUG,
                            "[HistoryStore] Ingested " + hash + " as record " +
                                std::to_string(record.id) + " (" +
                                std::to_string(bytes.size()) + " bytes)");
  return record;
}

void HistoryStore::enforceLimit() {
  if (!eviction_.enabled())
    return;
  std::optional<SqliteDatabase::Transaction> tx;
  if (db_)
    tx.emplace(*db_);
  RecordList evicted;
  try {
    evicted = eviction_.enforce(*index_, ledger_);
    if (tx)
      tx->commit();
  } catch (const std::exception &) {
    rollbackLocked(tx);
    throw;
  }
  ledger_.releasePending();
  if (!evicted.empty()) {
    MetricsRegistry::instance().incrementCounter(
        "mailcas_evictions_total", static_cast<double>(evicted.size()));
  }
}

std::optional<HistoryRecord> HistoryStore::access(int64_t id) {
  std::lock_guard<std::mutex> lock(mutationMutex_);
  if (!index_->updateLastAccessed(id, clock_->nowMillis())) {
    return std::nullopt;
  }
  auto record = index_->getById(id);
  publishLocked();
  return record;
}

bool HistoryStore::remove(int64_t id) {
  std::lock_guard<std::mutex> lock(mutationMutex_);
  auto record = index_->getById(id);
  if (!record) {
    return false;
  }
  std::optional<SqliteDatabase::Transaction> tx;
  if (db_)
    tx.emplace(*db_);
  uint32_t remaining = 0;
  try {
    // Record first: the ledger row must not disappear while referenced.
    index_->deleteById(id);
    remaining = ledger_.decrementRef(record->blobHash);
    if (tx)
      tx->commit();
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "[HistoryStore] Delete of record " +
                                  std::to_string(id) + " failed: " + e.what());
    rollbackLocked(tx);
    publishLocked();
    throw;
  }
  ledger_.releasePending();
  Logger::getInstance().log(LogLevel::DEBUG,
                            "[HistoryStore] Deleted record " +
                                std::to_string(id) + ", blob " +
                                record->blobHash + " has " +
                                std::to_string(remaining) + " refs left");
  publishLocked();
  return true;
}

void HistoryStore::clearAll() {
  std::lock_guard<std::mutex> lock(mutationMutex_);
  std::optional<SqliteDatabase::Transaction> tx;
  if (db_)
    tx.emplace(*db_);
  size_t removed = 0;
  try {
    removed = index_->deleteAll();
    ledger_.clear();
    if (tx)
      tx->commit();
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              std::string("[HistoryStore] Clear failed: ") +
                                  e.what());
    rollbackLocked(tx);
    publishLocked();
    throw;
  }
  ledger_.releasePending();
  Logger::getInstance().log(LogLevel::INFO, "[HistoryStore] Cleared " +
                                                std::to_string(removed) +
                                                " records");
  publishLocked();
}

CacheStats HistoryStore::getCacheStats() const {
  return snapshot()->cacheStats();
}

std::optional<HistoryRecord> HistoryStore::get(int64_t id) const {
  return snapshot()->get(id);
}

RecordList HistoryStore::recent(size_t limit) const {
  return snapshot()->recent(limit);
}

RecordList HistoryStore::search(const std::string &text) const {
  return snapshot()->search(text);
}

RecordList HistoryStore::sortBy(SortField field,
                                SortDirection direction) const {
  return snapshot()->sortBy(field, direction);
}

RecordList HistoryStore::filter(const EmailFilter &f) const {
  return snapshot()->filter(f);
}

RecordList HistoryStore::query(const HistoryQuery &q) const {
  return snapshot()->query(q);
}

std::optional<std::string>
HistoryStore::blobPath(const std::string &hash) const {
  if (!snapshot()->blob(hash))
    return std::nullopt;
  return contents_->pathFor(hash);
}

std::optional<std::vector<std::byte>>
HistoryStore::readBlob(const std::string &hash) const {
  if (!snapshot()->blob(hash))
    return std::nullopt;
  return contents_->read(hash);
}

std::optional<BlobRecord>
HistoryStore::blobMeta(const std::string &hash) const {
  return snapshot()->blob(hash);
}

HistoryStore::SnapshotPtr HistoryStore::snapshot() const {
  std::lock_guard<std::mutex> lock(snapshotMutex_);
  return snapshot_;
}

HistoryStore::SubscriptionId HistoryStore::subscribe(Observer observer) {
  std::lock_guard<std::mutex> lock(mutationMutex_);
  SubscriptionId id = nextSubscription_++;
  observer(snapshot());
  observers_.emplace(id, std::move(observer));
  return id;
}

void HistoryStore::unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutationMutex_);
  observers_.erase(id);
}

ContentStore::GCStats HistoryStore::collectGarbage(bool dryRun) {
  std::lock_guard<std::mutex> lock(mutationMutex_);
  std::unordered_set<std::string> referenced;
  for (const auto &blob : ledger_.all())
    referenced.insert(blob.hash);
  return contents_->garbageCollect(referenced, dryRun);
}

// Caller holds mutationMutex_. With a transaction the rows come back and the
// files queued for deletion must stay; without one the erased rows are gone
// for good, so their files go too.
void HistoryStore::rollbackLocked(
    std::optional<SqliteDatabase::Transaction> &tx) {
  if (tx) {
    tx.reset();
    ledger_.discardPending();
  } else {
    ledger_.releasePending();
  }
}

// Caller holds mutationMutex_.
void HistoryStore::publishLocked() {
  auto next = std::make_shared<const HistorySnapshot>(
      index_->all(), ledger_.all(), version_++);
  {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    snapshot_ = next;
  }
  updateMetrics(*next);
  for (const auto &kv : observers_) {
    try {
      kv.second(next);
    } catch (const std::exception &e) {
      Logger::getInstance().log(LogLevel::ERROR,
                                "[HistoryStore] Observer " +
                                    std::to_string(kv.first) +
                                    " threw: " + e.what());
    }
  }
}

void HistoryStore::updateMetrics(const HistorySnapshot &snap) const {
  auto &metrics = MetricsRegistry::instance();
  metrics.setGauge("mailcas_history_entries",
                   static_cast<double>(snap.cacheStats().entryCount));
  metrics.setGauge("mailcas_blob_bytes",
                   static_cast<double>(snap.cacheStats().totalSizeBytes));
}

} // namespace mailcas
