/**
 * @file directoryindex.cpp
 * @brief Implementation of directory listing with hidden-name filtering
 */

#include "directoryindex.hpp"
#include "pathutils.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <system_error>
#include <vector>

const std::unordered_set<std::string> DirectoryIndex::DEFAULT_IGNORED_NAMES = {
    "node_modules", "vendor"};

/**
 * @brief Reads the listing of a directory
 *
 * Iterates the directory with error codes instead of exceptions: an error
 * while opening or stepping the iterator ends the scan and keeps whatever was
 * collected so far. For an unreadable directory that is nothing, and the
 * listing consists of the self entry alone.
 *
 * Entry types come from the directory entry itself (symlink_status), so a
 * symlink pointing at a directory is not listed.
 *
 * @param dir Absolute, normalized directory path
 * @return Listing with the self entry first and sorted children after it
 *
 * @see isHidden()
 */
Listing DirectoryIndex::load(const std::string &dir) const {
  std::vector<std::string> names;
  std::error_code ec;

  std::filesystem::directory_iterator it(dir, ec);
  std::filesystem::directory_iterator end;

  while (!ec && it != end) {
    std::error_code type_ec;
    auto status = it->symlink_status(type_ec);

    if (!type_ec && std::filesystem::is_directory(status)) {
      std::string name = it->path().filename().string();
      if (!isHidden(name)) {
        names.push_back(name);
      }
    }

    it.increment(ec);
  }

  if (ec) {
    spdlog::debug("listing {} stopped: {}", dir, ec.message());
  }

  // Byte-wise order, uppercase before lowercase
  std::sort(names.begin(), names.end());

  Listing listing;
  listing.reserve(names.size() + 1);
  listing.push_back(makeSelfEntry(dir));
  for (const auto &name : names) {
    listing.emplace_back(name, joinPath(dir, name));
  }

  spdlog::debug("loaded {} ({} folders)", dir, names.size());
  return listing;
}

bool DirectoryIndex::isHidden(const std::string &name) const {
  if (name.empty() || name[0] == '.') {
    return true;
  }
  return m_ignored_names.count(name) > 0;
}

Entry DirectoryIndex::makeSelfEntry(const std::string &dir) {
  return Entry("[" + baseName(dir) + "]", dir, true);
}
