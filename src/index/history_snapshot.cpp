#include "index/history_snapshot.h"

namespace mailcas {

HistorySnapshot::HistorySnapshot(RecordList records,
                                 const std::vector<BlobRecord> &blobs,
                                 uint64_t version)
    : records_(std::move(records)), version_(version) {
  for (size_t i = 0; i < records_.size(); ++i)
    byId_.emplace(records_[i].id, i);
  for (const auto &b : blobs) {
    blobs_.emplace(b.hash, b);
    stats_.totalSizeBytes += b.sizeBytes;
  }
  stats_.entryCount = records_.size();
}

std::optional<HistoryRecord> HistorySnapshot::get(int64_t id) const {
  auto it = byId_.find(id);
  if (it == byId_.end())
    return std::nullopt;
  return records_[it->second];
}

RecordList HistorySnapshot::recent(size_t limit) const {
  if (limit >= records_.size())
    return records_;
  return RecordList(records_.begin(),
                    records_.begin() + static_cast<std::ptrdiff_t>(limit));
}

RecordList HistorySnapshot::search(const std::string &text) const {
  return mailcas::query::search(records_, text);
}

RecordList HistorySnapshot::sortBy(SortField field,
                                   SortDirection direction) const {
  return mailcas::query::sortBy(records_, field, direction);
}

RecordList HistorySnapshot::filter(const EmailFilter &f) const {
  return mailcas::query::filter(records_, f);
}

RecordList HistorySnapshot::query(const HistoryQuery &q) const {
  return mailcas::query::run(records_, q);
}

std::optional<BlobRecord>
HistorySnapshot::blob(const std::string &hash) const {
  auto it = blobs_.find(hash);
  if (it == blobs_.end())
    return std::nullopt;
  return it->second;
}

} // namespace mailcas
