#ifndef MAILCAS_CONTENT_HASHER_HPP
#define MAILCAS_CONTENT_HASHER_HPP

#include <cstddef> // For std::byte
#include <sodium.h>
#include <span>
#include <string>

#include "utilities/digest.hpp"

namespace mailcas {

struct DigestResult {
  utils::DigestArray digest; ///< Raw SHA-256 digest
  std::string hex;           ///< Lowercase hex rendering, the content hash
};

/**
 * @brief Incremental SHA-256 over a byte stream.
 *
 * Feed data with ingest() any number of times, then call finalize_hashed()
 * exactly once. The same bytes always produce the same hash regardless of
 * how they were split across ingest() calls.
 */
class ContentHasher {
public:
  /**
   * @throw HashComputationFailure If libsodium cannot be initialized.
   */
  ContentHasher();

  void ingest(const std::byte *data, size_t size);
  void ingest(std::span<const std::byte> data) {
    ingest(data.data(), data.size());
  }

  /// Total number of bytes fed so far.
  size_t bytesIngested() const { return bytes_; }

  /**
   * @throw std::logic_error If called more than once.
   */
  DigestResult finalize_hashed();

  /// One-shot helper: hex SHA-256 of @p data.
  static std::string sha256_hex(std::span<const std::byte> data);

private:
  crypto_hash_sha256_state sha_state_;
  size_t bytes_ = 0;
  bool finalized_ = false;
};

} // namespace mailcas

#endif // MAILCAS_CONTENT_HASHER_HPP
