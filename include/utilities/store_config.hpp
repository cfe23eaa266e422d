#pragma once

#include <cstdint>
#include <string>

#include "utilities/logger.h"

namespace mailcas {

/**
 * @brief How re-ingesting known content is treated.
 */
enum class DedupPolicy {
  /// One history record per content hash; re-ingest bumps lastAccessed.
  UniquePerContent,
  /// Every ingest creates a record; the blob refcount tracks all of them.
  SharedReferences
};

/// Where history records and blob rows are kept.
enum class IndexBackend { Sqlite, Memory };

struct StoreConfig {
  std::string baseDir;
  /// Retention bound on history records; 0 or less keeps everything.
  int64_t historyLimit = 0;
  DedupPolicy dedupPolicy = DedupPolicy::UniquePerContent;
  IndexBackend indexBackend = IndexBackend::Sqlite;
  /// fsync blob files and the cas/ directory before registering a blob.
  bool durableWrites = true;
  /// Empty leaves the logger as the host configured it.
  std::string logFile;
  LogLevel logLevel = LogLevel::INFO;
};

DedupPolicy dedupPolicyFromString(const std::string &name);
std::string toString(DedupPolicy policy);
IndexBackend indexBackendFromString(const std::string &name);
std::string toString(IndexBackend backend);

/**
 * @brief Read a YAML store configuration.
 *
 * Recognized keys: base_dir, history_limit, dedup_policy (unique|shared),
 * index_backend (sqlite|memory), durable_writes, log_file, log_level.
 * A missing file yields the defaults. MAILCAS_BASE_DIR,
 * MAILCAS_HISTORY_LIMIT and MAILCAS_LOG_LEVEL override file values.
 *
 * @throws std::invalid_argument on malformed YAML or an invalid value.
 */
StoreConfig loadStoreConfig(const std::string &path);

/// loadStoreConfig($MAILCAS_CONFIG or "mailcas_config.yaml").
StoreConfig loadStoreConfig();

} // namespace mailcas
