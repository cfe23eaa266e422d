#ifndef MAILCAS_HASH_UTILS_HPP
#define MAILCAS_HASH_UTILS_HPP

#include <string>

#include "digest.hpp"

namespace mailcas::utils {

/**
 * @brief Render a digest as 64 lowercase hex characters.
 */
std::string digest_to_hex(const DigestArray &digest);

/**
 * @brief Parse a hex string back into a digest.
 * @param hex 64 hex characters; upper case is accepted.
 * @return The decoded digest.
 * @throws std::invalid_argument if the string has the wrong length or a
 * non-hex character.
 */
DigestArray hex_to_digest(const std::string &hex);

/**
 * @brief True if @p hash is a canonical content hash: exactly 64 lowercase
 * hex characters. Only canonical hashes are used as file names under cas/.
 */
bool is_content_hash(const std::string &hash);

} // namespace mailcas::utils

#endif // MAILCAS_HASH_UTILS_HPP
