#ifndef PATHSAFETY_HPP
#define PATHSAFETY_HPP

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

/**
 * @brief Guards recursive delete and archive against catastrophic targets
 *
 * The browser already refuses the self entry and "/". These checks run
 * inside the mutation itself, right before anything is touched.
 */
class PathSafety {
public:
  enum class SafetyStatus {
    Allowed,
    BlockedSystemPath,
    BlockedHome,
    BlockedMountPoint,
    BlockedVirtualFS
  };

  /**
   * @brief Check if deleting or moving a directory is allowed
   * @param path Absolute, normalized directory path
   * @param home User's home directory, if known
   * @return SafetyStatus indicating if/why the operation is blocked
   */
  static SafetyStatus checkDeletion(const std::string &path,
                                    const std::optional<std::string> &home);

  /**
   * @brief Get human-readable message for a safety status
   */
  static std::string getStatusMessage(SafetyStatus status,
                                      const std::string &path);

  /**
   * @brief Check if path is a critical system directory
   */
  static bool isSystemPath(const std::string &path);

  /**
   * @brief Check if path is the given home directory or one of its parents
   *
   * Deleting "/home" takes the home directory with it, so ancestors count.
   */
  static bool isUserHome(const std::string &path,
                         const std::optional<std::string> &home);

  /**
   * @brief Check if path is a mount point
   */
  static bool isMountPoint(const std::string &path);

  /**
   * @brief Check if path is on a kernel/virtual filesystem
   */
  static bool isVirtualFilesystem(const std::string &path);

  /**
   * @brief Get all mount point paths from /proc/mounts
   */
  static std::vector<std::string> getMountPoints();

private:
  static const std::unordered_set<std::string> CRITICAL_PATHS;
};

#endif // PATHSAFETY_HPP
