/**
 * @file config.hpp
 * @brief Optional YAML configuration of the folder picker
 */

#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace YAML {
class Node;
}

/**
 * @class PickerConfig
 * @brief Settings read from config.yml, with built-in defaults
 *
 * Recognized keys:
 * @code
 * archive_dir: Dev-Archive          # relative to $HOME, or absolute
 * ignored_names: [node_modules, vendor]
 * log_file: ""                      # empty: no logging while the UI runs
 * log_level: info                   # trace|debug|info|warn|error|off
 * @endcode
 *
 * Unknown keys are ignored. A key with the wrong type keeps its default and
 * is reported through warnings().
 */
class PickerConfig {
private:
  std::string m_archive_dir;
  std::unordered_set<std::string> m_ignored_names;
  std::string m_log_file;
  std::string m_log_level = "info";

  /** @brief Problems found while loading, for the caller to log */
  std::vector<std::string> m_warnings;

  /** @brief Applies the keys of a parsed document */
  bool apply(const YAML::Node &root);

public:
  PickerConfig();

  /**
   * @brief Loads settings from a YAML file
   *
   * @param path File to read
   * @return false if the file cannot be read or is not valid YAML; the
   *         defaults stay in place in that case
   */
  bool loadFromFile(const std::string &path);

  /** @brief Same as loadFromFile() for an in-memory document */
  bool loadFromString(const std::string &yaml);

  const std::string &getArchiveDir() const { return m_archive_dir; }
  const std::unordered_set<std::string> &getIgnoredNames() const {
    return m_ignored_names;
  }
  const std::string &getLogFile() const { return m_log_file; }
  const std::string &getLogLevel() const { return m_log_level; }
  const std::vector<std::string> &warnings() const { return m_warnings; }

  /**
   * @brief Location of config.yml
   *
   * $XDG_CONFIG_HOME/folderpick/config.yml, falling back to
   * ~/.config/folderpick/config.yml.
   *
   * @return std::nullopt if neither XDG_CONFIG_HOME nor a home is known
   */
  static std::optional<std::string>
  defaultConfigPath(const std::optional<std::string> &home);
};

#endif // CONFIG_HPP
