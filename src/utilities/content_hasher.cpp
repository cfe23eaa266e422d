#include "utilities/content_hasher.hpp"
#include "utilities/errors.h"
#include "utilities/hash_utils.hpp"

#include <stdexcept>

namespace mailcas {

ContentHasher::ContentHasher() {
  // sodium_init() returns -1 on error, 0 on success, 1 if already initialized
  if (sodium_init() < 0) {
    throw HashComputationFailure("Failed to initialize libsodium");
  }
  if (crypto_hash_sha256_init(&sha_state_) != 0) {
    throw HashComputationFailure("crypto_hash_sha256_init failed");
  }
}

void ContentHasher::ingest(const std::byte *data, size_t size) {
  if (finalized_) {
    throw std::logic_error(
        "Cannot ingest data after finalize_hashed() has been called.");
  }
  if (data && size > 0) {
    if (crypto_hash_sha256_update(
            &sha_state_, reinterpret_cast<const unsigned char *>(data),
            size) != 0) {
      throw HashComputationFailure("crypto_hash_sha256_update failed");
    }
    bytes_ += size;
  }
}

DigestResult ContentHasher::finalize_hashed() {
  if (finalized_) {
    throw std::logic_error("finalize_hashed() already called.");
  }

  DigestResult result;
  if (crypto_hash_sha256_final(&sha_state_, result.digest.data()) != 0) {
    throw HashComputationFailure("crypto_hash_sha256_final failed");
  }
  result.hex = utils::digest_to_hex(result.digest);
  finalized_ = true;
  return result;
}

std::string ContentHasher::sha256_hex(std::span<const std::byte> data) {
  ContentHasher hasher;
  hasher.ingest(data);
  return hasher.finalize_hashed().hex;
}

} // namespace mailcas
