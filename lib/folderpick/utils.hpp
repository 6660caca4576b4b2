/**
 * @file utils.hpp
 * @brief Small helpers shared across the folder picker
 *
 * Key utilities:
 * - safe_at: Bounds-checked vector element access
 * - toLowerAscii / splitWords: text handling for the filter
 * - popLastCodepoint / isPrintableKey: UTF-8 aware text input
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstddef> // size_t
#include <sstream>
#include <string>
#include <vector>

/**
 * @brief Safely accesses a vector element with bounds checking
 *
 * @tparam T The type of elements stored in the vector
 * @param vec The vector to access
 * @param index The index to access (may be negative or out of range)
 * @return Pointer to the element, or nullptr if index is out of range
 *
 * @code
 * if (const Entry *entry = safe_at(view, cursor)) {
 *   open(entry->getPath());
 * }
 * @endcode
 */
template <typename T>
const T *safe_at(const std::vector<T> &vec, int index) {
  if (index < 0 || static_cast<size_t>(index) >= vec.size())
    return nullptr;
  return &vec[static_cast<size_t>(index)];
}

/**
 * @brief Lowercases ASCII letters, leaving all other bytes untouched
 *
 * Multi-byte UTF-8 sequences pass through unchanged, so non-ASCII letters
 * compare case-sensitively.
 */
inline std::string toLowerAscii(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

/** @brief Splits on any run of whitespace, dropping empty tokens */
inline std::vector<std::string> splitWords(const std::string &text) {
  std::vector<std::string> words;
  std::istringstream stream(text);
  std::string word;
  while (stream >> word) {
    words.push_back(word);
  }
  return words;
}

/**
 * @brief Removes the last UTF-8 code point from a string
 *
 * Continuation bytes (10xxxxxx) are removed together with their lead byte.
 * Does nothing on an empty string.
 */
inline void popLastCodepoint(std::string &text) {
  if (text.empty())
    return;

  size_t pos = text.size() - 1;
  while (pos > 0 && (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) {
    --pos;
  }
  text.erase(pos);
}

/**
 * @brief Checks if a key label is a single printable character
 *
 * Accepts exactly one UTF-8 code point that is not a control character.
 * Named keys such as "enter" or "ctrl+n" are longer than one code point and
 * are rejected.
 */
inline bool isPrintableKey(const std::string &key) {
  if (key.empty())
    return false;

  auto lead = static_cast<unsigned char>(key[0]);
  size_t length = 1;
  if (lead >= 0xF0)
    length = 4;
  else if (lead >= 0xE0)
    length = 3;
  else if (lead >= 0xC0)
    length = 2;
  else if (lead >= 0x80)
    return false; // stray continuation byte

  if (key.size() != length)
    return false;

  if (length == 1)
    return lead >= 0x20 && lead != 0x7F;

  for (size_t i = 1; i < length; ++i) {
    if ((static_cast<unsigned char>(key[i]) & 0xC0) != 0x80)
      return false;
  }
  return true;
}

#endif // UTILS_HPP
