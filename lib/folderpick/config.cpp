/**
 * @file config.cpp
 * @brief yaml-cpp based loading of config.yml
 */

#include "config.hpp"
#include "directoryindex.hpp"
#include "mutationops.hpp"
#include "pathutils.hpp"

#include <cstdlib>
#include <yaml-cpp/yaml.h>

namespace {

/**
 * @brief Reads one scalar key, keeping the current value on a type error
 */
void readString(const YAML::Node &root, const char *key, std::string &target,
                std::vector<std::string> &warnings) {
  const YAML::Node node = root[key];
  if (!node) {
    return;
  }
  try {
    target = node.as<std::string>();
  } catch (const YAML::Exception &e) {
    warnings.push_back(std::string("config: '") + key +
                       "' must be a string: " + e.what());
  }
}

} // namespace

PickerConfig::PickerConfig()
    : m_archive_dir(MutationOps::DEFAULT_ARCHIVE_DIR),
      m_ignored_names(DirectoryIndex::DEFAULT_IGNORED_NAMES) {}

bool PickerConfig::loadFromFile(const std::string &path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    m_warnings.push_back("config: cannot read " + path + ": " + e.what());
    return false;
  }
  return apply(root);
}

bool PickerConfig::loadFromString(const std::string &yaml) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception &e) {
    m_warnings.push_back(std::string("config: parse error: ") + e.what());
    return false;
  }
  return apply(root);
}

/**
 * @brief Applies the keys of a parsed YAML document
 *
 * An empty document is valid and changes nothing. A document whose top
 * level is not a mapping is rejected as a whole.
 *
 * @param root Parsed document
 * @return false for a non-mapping top level
 */
bool PickerConfig::apply(const YAML::Node &root) {
  if (root.IsNull()) {
    return true;
  }
  if (!root.IsMap()) {
    m_warnings.push_back("config: top level must be a mapping");
    return false;
  }

  readString(root, "archive_dir", m_archive_dir, m_warnings);
  readString(root, "log_file", m_log_file, m_warnings);
  readString(root, "log_level", m_log_level, m_warnings);

  if (const YAML::Node names = root["ignored_names"]) {
    if (names.IsSequence()) {
      std::unordered_set<std::string> ignored;
      try {
        for (const auto &name : names) {
          ignored.insert(name.as<std::string>());
        }
        m_ignored_names = std::move(ignored);
      } catch (const YAML::Exception &e) {
        m_warnings.push_back(std::string("config: 'ignored_names': ") +
                             e.what());
      }
    } else {
      m_warnings.push_back("config: 'ignored_names' must be a list");
    }
  }

  if (m_archive_dir.empty()) {
    m_warnings.push_back("config: 'archive_dir' is empty, using default");
    m_archive_dir = MutationOps::DEFAULT_ARCHIVE_DIR;
  }

  return true;
}

std::optional<std::string>
PickerConfig::defaultConfigPath(const std::optional<std::string> &home) {
  const char *xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg == '/') {
    return joinPath(joinPath(xdg, "folderpick"), "config.yml");
  }
  if (!home) {
    return std::nullopt;
  }
  return joinPath(joinPath(joinPath(*home, ".config"), "folderpick"),
                  "config.yml");
}
