#pragma once
#include <map>

#include "index/history_index.h"

namespace mailcas {

/**
 * @brief HistoryIndex kept entirely in process memory.
 *
 * Used for tests and for stores that do not need the index to survive a
 * restart. Ids come from a counter and are never reused.
 */
class MemoryHistoryIndex : public HistoryIndex {
public:
  /// @param uniqueBlobHash reject a second record for the same blob hash.
  explicit MemoryHistoryIndex(bool uniqueBlobHash = true);

  int64_t insert(const HistoryRecord &record) override;
  std::optional<HistoryRecord> getById(int64_t id) const override;
  bool updateLastAccessed(int64_t id, int64_t timestamp) override;
  bool deleteById(int64_t id) override;
  size_t deleteAll() override;
  size_t countByBlobHash(const std::string &hash) const override;
  RecordList findByBlobHash(const std::string &hash) const override;
  size_t count() const override;
  RecordList all() const override;
  RecordList oldest(size_t n) const override;

private:
  bool uniqueBlobHash_;
  int64_t nextId_{1};
  std::map<int64_t, HistoryRecord> records_;
};

} // namespace mailcas
