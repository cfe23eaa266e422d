#include "utilities/hash_utils.hpp"

#include <stdexcept>

namespace mailcas::utils {

namespace {

constexpr char HEX_CHARS[] = "0123456789abcdef";

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

std::string digest_to_hex(const DigestArray &digest) {
  std::string out;
  out.reserve(HEX_DIGEST_LENGTH);
  for (uint8_t b : digest) {
    out.push_back(HEX_CHARS[b >> 4]);
    out.push_back(HEX_CHARS[b & 0x0f]);
  }
  return out;
}

DigestArray hex_to_digest(const std::string &hex) {
  if (hex.size() != HEX_DIGEST_LENGTH) {
    throw std::invalid_argument("Invalid hash: expected " +
                                std::to_string(HEX_DIGEST_LENGTH) +
                                " hex characters, got " +
                                std::to_string(hex.size()));
  }
  DigestArray digest{};
  for (size_t i = 0; i < DIGEST_SIZE; ++i) {
    int hi = hex_value(hex[2 * i]);
    int lo = hex_value(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      throw std::invalid_argument("Invalid hash: non-hex character in " + hex);
    }
    digest[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return digest;
}

bool is_content_hash(const std::string &hash) {
  if (hash.size() != HEX_DIGEST_LENGTH)
    return false;
  for (char c : hash) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
      return false;
  }
  return true;
}

} // namespace mailcas::utils
