#ifndef ENTRY_HPP
#define ENTRY_HPP

#include <string>
#include <vector>

/**
 * @brief A single row of a directory listing
 *
 * Either a real subdirectory or the synthetic "self" row that stands for
 * the directory being listed. The self row is displayed as "[name]" and
 * carries the directory's own path.
 */
class Entry {
private:
  std::string m_display_name;
  std::string m_path;
  bool m_is_self;

public:
  Entry(const std::string &display_name, const std::string &path,
        bool is_self = false)
      : m_display_name(display_name), m_path(path), m_is_self(is_self) {}

  const std::string &getDisplayName() const { return m_display_name; }
  const std::string &getPath() const { return m_path; }
  bool isSelf() const { return m_is_self; }

  bool operator==(const Entry &other) const {
    return m_display_name == other.m_display_name && m_path == other.m_path &&
           m_is_self == other.m_is_self;
  }
  bool operator!=(const Entry &other) const { return !(*this == other); }
};

/** @brief Ordered entries of one directory, self entry first */
using Listing = std::vector<Entry>;

#endif // ENTRY_HPP
