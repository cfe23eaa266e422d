#ifndef MAILCAS_BLOB_LEDGER_HPP
#define MAILCAS_BLOB_LEDGER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "store/blob_table.hpp"
#include "store/content_store.hpp"
#include "store/records.h"

namespace mailcas {

/**
 * @brief Reference counts for stored blobs.
 *
 * A ledger row exists exactly while at least one HistoryRecord references
 * the hash. When the last reference goes away the row is erased and the blob
 * file is queued; the file is only deleted by releasePending(), once the
 * caller has made the row change durable. A rolled back row therefore never
 * points at a deleted file. Any state that contradicts the counts throws
 * LedgerInvariantError instead of being clamped.
 */
class BlobLedger {
public:
  BlobLedger(ContentStore &store, BlobTable &table);

  std::optional<BlobRecord> lookup(const std::string &hash) const;

  /**
   * @brief Record a newly stored blob with a refcount of one.
   * @throws LedgerInvariantError if the hash is already in the ledger.
   */
  BlobRecord create(const std::string &hash, uint64_t sizeBytes);

  /**
   * @brief Add a reference to an existing blob.
   * @return The new refcount.
   * @throws LedgerInvariantError if the hash is unknown.
   */
  uint32_t incrementRef(const std::string &hash);

  /**
   * @brief Drop a reference; at zero the row is erased and the blob file is
   * queued for releasePending().
   * @return The remaining refcount.
   * @throws LedgerInvariantError if the hash is unknown.
   */
  uint32_t decrementRef(const std::string &hash);

  std::vector<BlobRecord> all() const;
  uint64_t totalSizeBytes() const;

  /// Drop every row and queue a sweep of the whole blob directory.
  void clear();

  /**
   * @brief Delete the blob files queued since the last release or discard.
   *
   * Files that cannot be deleted are logged and left behind as orphans for
   * ContentStore::garbageCollect.
   * @return The number of files deleted.
   */
  size_t releasePending();

  /// Forget queued deletions because the row changes were rolled back.
  void discardPending();

  const std::vector<std::string> &pending() const { return pending_; }

private:
  ContentStore &store_;
  BlobTable &table_;
  std::vector<std::string> pending_;
  bool sweepPending_ = false;
};

} // namespace mailcas

#endif // MAILCAS_BLOB_LEDGER_HPP
