#ifndef MAILCAS_TEXT_UTILS_HPP
#define MAILCAS_TEXT_UTILS_HPP

#include <cstddef>
#include <string>

namespace mailcas::text {

/// Lower-case ASCII letters only; other bytes (including UTF-8) are kept.
std::string foldAscii(const std::string &s);

/// Case-insensitive (ASCII) substring test. An empty needle always matches.
bool containsIgnoreCase(const std::string &haystack, const std::string &needle);

/// Three-way ASCII case-insensitive comparison, bytes compared unsigned.
int compareIgnoreCase(const std::string &a, const std::string &b);

/// True if @p s is empty or only contains ASCII whitespace.
bool isBlank(const std::string &s);

/// Strip leading and trailing ASCII whitespace.
std::string trim(const std::string &s);

/// Number of UTF-8 code points in @p s.
size_t utf8Length(const std::string &s);

/**
 * @brief Cut @p s to at most @p maxChars code points without splitting a
 * multi-byte UTF-8 sequence.
 */
std::string truncateUtf8(const std::string &s, size_t maxChars);

} // namespace mailcas::text

#endif // MAILCAS_TEXT_UTILS_HPP
