#pragma once

#include <string>

namespace mailcas {

/**
 * @brief Base directory used when neither the config nor the caller names
 * one: $MAILCAS_BASE_DIR, else "var/mailcas" relative to the working dir.
 */
std::string defaultBaseDir();

/**
 * @brief On-disk layout owned by one HistoryStore.
 *
 * <base>/cas/<hash>      one file per stored payload
 * <base>/index.db        SQLite metadata (history_items, blobs)
 * <base>/logs/           log files when the host logs under the base dir
 */
class StorePaths {
public:
  explicit StorePaths(std::string baseDir);

  const std::string &baseDir() const { return baseDir_; }
  std::string casDir() const;
  std::string blobPath(const std::string &hash) const;
  std::string indexDbPath() const;
  std::string logsDir() const;

  /// Prefix of in-flight writes inside cas/; never a valid hash.
  static constexpr const char *TEMP_PREFIX = ".tmp-";

private:
  std::string baseDir_;
};

} // namespace mailcas
