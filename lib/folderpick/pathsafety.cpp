/**
 * @file pathsafety.cpp
 * @brief Safety checks run before a directory is deleted or archived
 */

#include "pathsafety.hpp"

#include <fstream>
#include <sstream>
#include <sys/vfs.h>

/**
 * @brief Top-level system directories that are never deleted or moved
 */
const std::unordered_set<std::string> PathSafety::CRITICAL_PATHS = {
    "/",    "/boot", "/dev", "/etc",  "/lib", "/lib64", "/proc", "/root", "/run",
    "/sys", "/usr",  "/var", "/bin",  "/sbin", "/opt",  "/srv",  "/tmp"};

/**
 * @brief Checks whether a directory may be deleted or archived
 *
 * Checks run in order of severity:
 * 1. Critical system paths
 * 2. The user's home directory and its parents
 * 3. Mount points
 * 4. Kernel/virtual filesystems (procfs, sysfs, ...)
 *
 * @param path Absolute, normalized directory path
 * @param home User's home directory, if known
 * @return The first failing check, or SafetyStatus::Allowed
 */
PathSafety::SafetyStatus
PathSafety::checkDeletion(const std::string &path,
                          const std::optional<std::string> &home) {
  if (isSystemPath(path)) {
    return SafetyStatus::BlockedSystemPath;
  }

  if (isUserHome(path, home)) {
    return SafetyStatus::BlockedHome;
  }

  if (isMountPoint(path)) {
    return SafetyStatus::BlockedMountPoint;
  }

  if (isVirtualFilesystem(path)) {
    return SafetyStatus::BlockedVirtualFS;
  }

  return SafetyStatus::Allowed;
}

std::string PathSafety::getStatusMessage(SafetyStatus status,
                                         const std::string &path) {
  switch (status) {
  case SafetyStatus::Allowed:
    return "Allowed";
  case SafetyStatus::BlockedSystemPath:
    return "Cannot touch system directory: " + path;
  case SafetyStatus::BlockedHome:
    return "Cannot touch your home directory or its parents: " + path;
  case SafetyStatus::BlockedMountPoint:
    return "Cannot touch mount point: " + path;
  case SafetyStatus::BlockedVirtualFS:
    return "Cannot touch virtual/system filesystem: " + path;
  default:
    return "Unknown status";
  }
}

bool PathSafety::isSystemPath(const std::string &path) {
  return CRITICAL_PATHS.count(path) > 0;
}

bool PathSafety::isUserHome(const std::string &path,
                            const std::optional<std::string> &home) {
  if (!home) {
    return false;
  }
  if (path == *home) {
    return true;
  }
  const std::string prefix = path == "/" ? path : path + "/";
  return home->compare(0, prefix.size(), prefix) == 0;
}

bool PathSafety::isMountPoint(const std::string &path) {
  for (const auto &mountpoint : getMountPoints()) {
    if (mountpoint == path) {
      return true;
    }
  }
  return false;
}

/**
 * @brief Checks if a path resides on a kernel or virtual filesystem
 *
 * Uses statfs() and compares the filesystem magic against procfs, sysfs,
 * devpts, securityfs and both cgroup versions. Memory-backed filesystems
 * such as tmpfs are ordinary storage from the user's point of view and are
 * not blocked.
 *
 * @param path Path to check
 * @return true if statfs() identifies a virtual filesystem; false otherwise,
 *         including when statfs() fails (the mutation then reports the real
 *         error)
 *
 * @note Magic numbers from /usr/include/linux/magic.h
 */
bool PathSafety::isVirtualFilesystem(const std::string &path) {
  struct statfs fs_info;

  if (statfs(path.c_str(), &fs_info) != 0) {
    return false;
  }

  const long VIRTUAL_FS[] = {
      0x9fa0,     // PROC_SUPER_MAGIC
      0x62656572, // SYSFS_MAGIC
      0x1cd1,     // DEVPTS_SUPER_MAGIC
      0x73636673, // SECURITYFS_MAGIC
      0x27e0eb,   // CGROUP_SUPER_MAGIC
      0x63677270, // CGROUP2_SUPER_MAGIC
  };

  for (auto magic : VIRTUAL_FS) {
    if (static_cast<long>(fs_info.f_type) == magic) {
      return true;
    }
  }

  return false;
}

/**
 * @brief Parses /proc/mounts
 *
 * @return The mount point column of every line, or an empty vector if
 *         /proc/mounts cannot be opened
 *
 * @note Mount points containing spaces appear octal-escaped ("\040") in
 *       /proc/mounts and will not compare equal to the real path
 */
std::vector<std::string> PathSafety::getMountPoints() {
  std::vector<std::string> mounts;
  std::ifstream mounts_file("/proc/mounts");

  if (!mounts_file.is_open()) {
    return mounts;
  }

  std::string line;
  while (std::getline(mounts_file, line)) {
    std::istringstream iss(line);
    std::string device;
    std::string mountpoint;

    iss >> device >> mountpoint;
    if (!mountpoint.empty()) {
      mounts.push_back(mountpoint);
    }
  }

  return mounts;
}
