/**
 * @file mutationops.hpp
 * @brief Filesystem implementation of create, delete and archive
 */

#ifndef MUTATIONOPS_HPP
#define MUTATIONOPS_HPP

#include <optional>
#include <string>
#include <system_error>

#include "imutationops.hpp"

/**
 * @class MutationOps
 * @brief Performs folder mutations directly on the local filesystem
 *
 * - createFolder: one level, fails if the name exists or is invalid
 * - deleteFolder: recursive and irreversible
 * - archiveFolder: renames the folder into the archive directory, keyed by
 *   its base name; never overwrites
 *
 * Delete and archive refuse paths rejected by PathSafety.
 *
 * @see PathSafety
 */
class MutationOps : public IMutationOps {
private:
  /** @brief Home directory used for the archive and the safety checks */
  std::optional<std::string> m_home;

  /** @brief Archive directory, absolute or relative to m_home */
  std::string m_archive_dir;

public:
  /** @brief Archive directory name used when no configuration overrides it */
  static constexpr const char *DEFAULT_ARCHIVE_DIR = "Dev-Archive";

  MutationOps(const std::optional<std::string> &home,
              const std::string &archive_dir = DEFAULT_ARCHIVE_DIR)
      : m_home(home), m_archive_dir(archive_dir) {}

  MutationResult createFolder(const std::string &parent,
                              const std::string &name) override;
  MutationResult deleteFolder(const std::string &path) override;
  MutationResult archiveFolder(const std::string &path) override;

  /**
   * @brief Absolute path of the archive directory
   *
   * @return std::nullopt if the archive directory is relative and no home
   *         directory is known
   */
  std::optional<std::string> archiveDirectory() const;

  /**
   * @brief Checks a folder name typed by the user
   *
   * Rejects empty names, "." and "..", and names containing '/' or NUL.
   */
  static bool isValidFolderName(const std::string &name);

  /** @brief Maps an OS error onto a MutationStatus */
  static MutationStatus statusFromError(const std::error_code &ec);
};

#endif // MUTATIONOPS_HPP
