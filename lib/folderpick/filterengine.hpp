/**
 * @file filterengine.hpp
 * @brief Word filter applied to directory listings
 */

#ifndef FILTERENGINE_HPP
#define FILTERENGINE_HPP

#include <string>

#include "entry.hpp"

/**
 * @class FilterEngine
 * @brief Narrows a listing to the entries matching every typed word
 *
 * The query is trimmed, lowercased and split on whitespace. An entry
 * matches when each word occurs somewhere in its lowercased display name.
 * There is no ranking: matches keep their listing order.
 *
 * Examples for the query "my proj":
 * - "my-project"     matches
 * - "project-my-app" matches
 * - "project-app"    does not match ("my" is missing)
 */
class FilterEngine {
public:
  /**
   * @brief Applies a query to a listing
   *
   * @param listing The full listing, self entry included
   * @param query Raw filter text as typed
   * @return Matching entries in listing order; the whole listing for an
   *         empty or whitespace-only query
   */
  static Listing filter(const Listing &listing, const std::string &query);

  /** @brief Tests one display name against already lowercased words */
  static bool matches(const std::string &display_name,
                      const std::vector<std::string> &words);
};

#endif // FILTERENGINE_HPP
