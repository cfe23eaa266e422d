#ifndef MAILCAS_DIGEST_HPP
#define MAILCAS_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace mailcas::utils {

/// Digest size for SHA-256 (32 bytes).
inline constexpr size_t DIGEST_SIZE = 32;

/// Length of a digest rendered as lowercase hex.
inline constexpr size_t HEX_DIGEST_LENGTH = DIGEST_SIZE * 2;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;

} // namespace mailcas::utils

#endif // MAILCAS_DIGEST_HPP
