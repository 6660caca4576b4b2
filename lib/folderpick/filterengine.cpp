/**
 * @file filterengine.cpp
 * @brief Word-based substring filter
 */

#include "filterengine.hpp"
#include "utils.hpp"

Listing FilterEngine::filter(const Listing &listing, const std::string &query) {
  auto words = splitWords(toLowerAscii(query));
  if (words.empty()) {
    return listing;
  }

  Listing result;
  for (const auto &entry : listing) {
    if (matches(entry.getDisplayName(), words)) {
      result.push_back(entry);
    }
  }
  return result;
}

bool FilterEngine::matches(const std::string &display_name,
                           const std::vector<std::string> &words) {
  const std::string name = toLowerAscii(display_name);
  for (const auto &word : words) {
    if (name.find(word) == std::string::npos) {
      return false;
    }
  }
  return true;
}
