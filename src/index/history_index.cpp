#include "index/history_index.h"

namespace mailcas {

RecordList HistoryIndex::recent(size_t limit) const {
  RecordList records = all();
  if (records.size() > limit)
    records.resize(limit);
  return records;
}

RecordList HistoryIndex::search(const std::string &text) const {
  return mailcas::query::search(all(), text);
}

RecordList HistoryIndex::sortBy(SortField field,
                                SortDirection direction) const {
  return mailcas::query::sortBy(all(), field, direction);
}

RecordList HistoryIndex::filter(const EmailFilter &f) const {
  return mailcas::query::filter(all(), f);
}

RecordList HistoryIndex::query(const HistoryQuery &q) const {
  return mailcas::query::run(all(), q);
}

} // namespace mailcas
