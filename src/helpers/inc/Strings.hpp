#ifndef IRQMON_HELPERS_STRINGS_HPP
#define IRQMON_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief Tokenizing and classification helpers for /proc text parsing.
 *
 * The kernel counter sources are whitespace-separated columns; these helpers
 * split them without copying (std::string_view into the caller's buffer).
 *
 * @note Views returned by split functions reference the input; the input must
 *       outlive them.
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace irqmon {
namespace helpers {
namespace strings {

/* ----------------------------- Classification ----------------------------- */

/// True for the blank characters that separate /proc columns.
[[nodiscard]] inline bool isBlank(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

/**
 * @brief Check that a token is a non-empty run of decimal digits.
 * @param tok Token to check.
 * @return true if every character is '0'..'9' and tok is non-empty.
 */
[[nodiscard]] inline bool isAllDigits(std::string_view tok) noexcept {
  if (tok.empty()) {
    return false;
  }
  for (const char C : tok) {
    if (C < '0' || C > '9') {
      return false;
    }
  }
  return true;
}

/* ----------------------------- Trimming ----------------------------- */

/**
 * @brief Strip leading and trailing blanks.
 * @param s Input view.
 * @return Sub-view without surrounding blanks (may be empty).
 */
[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
  std::size_t begin = 0;
  while (begin < s.size() && isBlank(s[begin])) {
    ++begin;
  }
  std::size_t end = s.size();
  while (end > begin && isBlank(s[end - 1])) {
    --end;
  }
  return s.substr(begin, end - begin);
}

/* ----------------------------- Splitting ----------------------------- */

/**
 * @brief Split on runs of blanks.
 * @param s Input view.
 * @return Non-empty tokens in order.
 * @note Allocates the result vector.
 */
[[nodiscard]] inline std::vector<std::string_view> splitWhitespace(std::string_view s) {
  std::vector<std::string_view> out;
  std::size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && isBlank(s[i])) {
      ++i;
    }
    const std::size_t START = i;
    while (i < s.size() && !isBlank(s[i])) {
      ++i;
    }
    if (i > START) {
      out.push_back(s.substr(START, i - START));
    }
  }
  return out;
}

/**
 * @brief Split on a single separator character, dropping empty fields.
 * @param s Input view.
 * @param sep Separator (e.g. ',').
 * @return Trimmed non-empty fields, each copied into a std::string.
 */
[[nodiscard]] inline std::vector<std::string> splitList(std::string_view s, char sep) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= s.size()) {
    std::size_t pos = s.find(sep, start);
    if (pos == std::string_view::npos) {
      pos = s.size();
    }
    const std::string_view FIELD = trim(s.substr(start, pos - start));
    if (!FIELD.empty()) {
      out.emplace_back(FIELD);
    }
    start = pos + 1;
  }
  return out;
}

/**
 * @brief Split text into lines (without the trailing '\n').
 * @param text Whole file contents.
 * @return One view per line; a final line without '\n' is included.
 */
[[nodiscard]] inline std::vector<std::string_view> splitLines(std::string_view text) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t pos = text.find('\n', start);
    if (pos == std::string_view::npos) {
      pos = text.size();
    }
    out.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return out;
}

/* ----------------------------- Prefix ----------------------------- */

/// Check if str starts with prefix.
[[nodiscard]] inline bool startsWith(std::string_view str, std::string_view prefix) noexcept {
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

} // namespace strings
} // namespace helpers
} // namespace irqmon

#endif // IRQMON_HELPERS_STRINGS_HPP
