#include "utilities/text_utils.hpp"

#include <algorithm>

namespace mailcas::text {

namespace {

inline unsigned char fold(unsigned char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<unsigned char>(c + ('a' - 'A'))
                                : c;
}

inline bool isSpace(unsigned char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

// Continuation bytes look like 10xxxxxx.
inline bool isContinuation(unsigned char c) { return (c & 0xC0) == 0x80; }

} // namespace

std::string foldAscii(const std::string &s) {
  std::string out(s);
  for (auto &c : out)
    c = static_cast<char>(fold(static_cast<unsigned char>(c)));
  return out;
}

bool containsIgnoreCase(const std::string &haystack,
                        const std::string &needle) {
  if (needle.empty())
    return true;
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(),
                        needle.end(), [](char a, char b) {
                          return fold(static_cast<unsigned char>(a)) ==
                                 fold(static_cast<unsigned char>(b));
                        });
  return it != haystack.end();
}

int compareIgnoreCase(const std::string &a, const std::string &b) {
  size_t n = std::min(a.size(), b.size());
  for (size_t i = 0; i < n; ++i) {
    unsigned char ca = fold(static_cast<unsigned char>(a[i]));
    unsigned char cb = fold(static_cast<unsigned char>(b[i]));
    if (ca != cb)
      return ca < cb ? -1 : 1;
  }
  if (a.size() == b.size())
    return 0;
  return a.size() < b.size() ? -1 : 1;
}

bool isBlank(const std::string &s) {
  return std::all_of(s.begin(), s.end(), [](char c) {
    return isSpace(static_cast<unsigned char>(c));
  });
}

std::string trim(const std::string &s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && isSpace(static_cast<unsigned char>(s[begin])))
    ++begin;
  while (end > begin && isSpace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return s.substr(begin, end - begin);
}

size_t utf8Length(const std::string &s) {
  return static_cast<size_t>(std::count_if(s.begin(), s.end(), [](char c) {
    return !isContinuation(static_cast<unsigned char>(c));
  }));
}

std::string truncateUtf8(const std::string &s, size_t maxChars) {
  size_t chars = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if (isContinuation(static_cast<unsigned char>(s[i])))
      continue;
    if (chars == maxChars)
      return s.substr(0, i);
    ++chars;
  }
  return s;
}

} // namespace mailcas::text
