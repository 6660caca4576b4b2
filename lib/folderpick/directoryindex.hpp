/**
 * @file directoryindex.hpp
 * @brief Directory listing for the folder picker
 *
 * This header defines the DirectoryIndex class which reads the immediate
 * subdirectories of a directory and turns them into an ordered Listing.
 */

#ifndef DIRECTORYINDEX_HPP
#define DIRECTORYINDEX_HPP

#include <filesystem>
#include <string>
#include <unordered_set>
#include <utility>

#include "entry.hpp"

/**
 * @class DirectoryIndex
 * @brief Lists the visible subdirectories of a directory
 *
 * Every call to load() reads the filesystem again; nothing is cached between
 * calls, so a listing is exactly as fresh as the last navigation.
 *
 * Listing rules:
 * - The first entry is the synthetic self entry ("[name]", path == dir)
 * - Only directories are listed; symlinks are not followed
 * - Names starting with '.' and the ignored names are skipped
 * - Remaining names are sorted by plain byte comparison ("Beta" < "alpha")
 *
 * @see Entry
 */
class DirectoryIndex {
private:
  /** @brief Directory names that are never listed */
  std::unordered_set<std::string> m_ignored_names;

public:
  /** @brief Names ignored when no configuration overrides them */
  static const std::unordered_set<std::string> DEFAULT_IGNORED_NAMES;

  DirectoryIndex() : m_ignored_names(DEFAULT_IGNORED_NAMES) {}

  explicit DirectoryIndex(std::unordered_set<std::string> ignored_names)
      : m_ignored_names(std::move(ignored_names)) {}

  /**
   * @brief Reads the listing of a directory
   *
   * A directory that cannot be read (missing, permission denied) yields a
   * listing that holds only the self entry.
   *
   * @param dir Absolute, normalized directory path
   * @return Listing with the self entry first and sorted children after it
   */
  Listing load(const std::string &dir) const;

  /** @brief True if a child with this name is left out of listings */
  bool isHidden(const std::string &name) const;

private:
  /**
   * @brief Builds the "[name]" row that stands for the directory itself
   */
  static Entry makeSelfEntry(const std::string &dir);
};

#endif // DIRECTORYINDEX_HPP
