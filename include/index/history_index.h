#pragma once
#ifndef MAILCAS_HISTORY_INDEX_H
#define MAILCAS_HISTORY_INDEX_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "index/history_query.hpp"
#include "store/records.h"

namespace mailcas {

/**
 * @brief Storage of HistoryRecords with CRUD and the query surface.
 *
 * Implementations are not internally synchronized; HistoryStore calls them
 * only while holding its mutation lock. Every read observes every write that
 * returned before it.
 */
class HistoryIndex {
public:
  virtual ~HistoryIndex() = default;

  /**
   * @brief Insert @p record, ignoring its id field.
   * @return The newly assigned id, larger than any id handed out before.
   * @throws IndexError if the backend rejects the row (e.g. a second record
   * for a hash while blob hashes are unique).
   */
  virtual int64_t insert(const HistoryRecord &record) = 0;

  virtual std::optional<HistoryRecord> getById(int64_t id) const = 0;

  /// @return false if no record has @p id.
  virtual bool updateLastAccessed(int64_t id, int64_t timestamp) = 0;

  /// @return false if no record had @p id.
  virtual bool deleteById(int64_t id) = 0;

  /// @return Number of records removed.
  virtual size_t deleteAll() = 0;

  virtual size_t countByBlobHash(const std::string &hash) const = 0;
  virtual RecordList findByBlobHash(const std::string &hash) const = 0;
  virtual size_t count() const = 0;

  /// Every record, most recently accessed first (ties: higher id first).
  virtual RecordList all() const = 0;

  /// The @p limit most recently accessed records.
  virtual RecordList recent(size_t limit) const;

  /// The @p n least recently accessed records, oldest first (ties: lower id).
  virtual RecordList oldest(size_t n) const = 0;

  virtual RecordList search(const std::string &text) const;
  virtual RecordList sortBy(SortField field, SortDirection direction) const;
  virtual RecordList filter(const EmailFilter &filter) const;
  virtual RecordList query(const HistoryQuery &q) const;
};

} // namespace mailcas

#endif // MAILCAS_HISTORY_INDEX_H
