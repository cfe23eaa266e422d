#include "store/eviction_policy.h"
#include "utilities/logger.h"

namespace mailcas {

RecordList EvictionPolicy::enforce(HistoryIndex &index,
                                   BlobLedger &ledger) const {
  RecordList evicted;
  if (!enabled())
    return evicted;

  const size_t count = index.count();
  const auto limit = static_cast<size_t>(limit_);
  if (count <= limit)
    return evicted;

  for (const auto &victim : index.oldest(count - limit)) {
    if (!index.deleteById(victim.id))
      continue;
    uint32_t remaining = ledger.decrementRef(victim.blobHash);
    Logger::getInstance().log(
        LogLevel::INFO, "[EvictionPolicy] Evicted record " +
                            std::to_string(victim.id) + " (blob " +
                            victim.blobHash + ", " +
                            std::to_string(remaining) + " refs left)");
    evicted.push_back(victim);
  }
  return evicted;
}

} // namespace mailcas
