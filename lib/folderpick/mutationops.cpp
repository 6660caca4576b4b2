/**
 * @file mutationops.cpp
 * @brief Implementation of folder create, delete and archive operations
 *
 * All std::filesystem calls use the error_code overloads; nothing in this
 * file throws. Each failure is logged and returned as a MutationResult whose
 * message is shown to the user.
 */

#include "mutationops.hpp"
#include "pathsafety.hpp"
#include "pathutils.hpp"

#include <filesystem>
#include <spdlog/spdlog.h>

namespace {

MutationResult fail(MutationStatus status, const std::string &message) {
  spdlog::warn("{}", message);
  return MutationResult::failure(status, message);
}

MutationResult failWithError(const std::string &what,
                             const std::error_code &ec) {
  return fail(MutationOps::statusFromError(ec),
              "Error: " + what + ": " + ec.message());
}

} // namespace

/**
 * @brief Creates one directory level under a parent directory
 *
 * std::filesystem::create_directory() reports an existing directory as
 * "not created" without an error; that case is turned into AlreadyExists.
 *
 * @param parent Directory the new folder goes into
 * @param name Folder name as typed by the user
 * @return Ok, InvalidName, AlreadyExists or the mapped OS error
 */
MutationResult MutationOps::createFolder(const std::string &parent,
                                         const std::string &name) {
  if (!isValidFolderName(name)) {
    return fail(MutationStatus::InvalidName,
                "Error: invalid folder name \"" + name + "\"");
  }

  const std::string path = joinPath(parent, name);
  std::error_code ec;

  bool created = std::filesystem::create_directory(path, ec);
  if (ec) {
    return failWithError("mkdir " + path, ec);
  }
  if (!created) {
    return fail(MutationStatus::AlreadyExists,
                "Error: mkdir " + path + ": file exists");
  }

  spdlog::info("created {}", path);
  return MutationResult::success();
}

/**
 * @brief Deletes a directory and everything below it
 *
 * Implementation flow:
 * 1. The target must exist and be a directory (symlinks are not followed)
 * 2. PathSafety must allow it
 * 3. std::filesystem::remove_all() removes the tree
 *
 * A failure in step 3 may leave the tree partially deleted; there is no
 * rollback.
 *
 * @param path Absolute, normalized directory path
 */
MutationResult MutationOps::deleteFolder(const std::string &path) {
  std::error_code ec;
  auto status = std::filesystem::symlink_status(path, ec);
  if (ec || !std::filesystem::exists(status)) {
    return fail(MutationStatus::NotFound,
                "Error: " + path + ": no such directory");
  }
  if (!std::filesystem::is_directory(status)) {
    return fail(MutationStatus::Failed, "Error: " + path + ": not a directory");
  }

  auto safety = PathSafety::checkDeletion(path, m_home);
  if (safety != PathSafety::SafetyStatus::Allowed) {
    return fail(MutationStatus::Protected,
                PathSafety::getStatusMessage(safety, path));
  }

  auto removed = std::filesystem::remove_all(path, ec);
  if (ec) {
    return failWithError("remove " + path, ec);
  }

  spdlog::info("deleted {} ({} items)", path, removed);
  return MutationResult::success();
}

/**
 * @brief Moves a directory into the archive directory
 *
 * The archive directory is created (with parents) when missing. The folder
 * keeps its base name; if the archive already holds an entry of that name
 * the move is refused rather than merged or overwritten. Moving across
 * filesystems is not attempted: rename() fails with CrossDevice.
 *
 * @param path Absolute, normalized directory path
 */
MutationResult MutationOps::archiveFolder(const std::string &path) {
  auto archive = archiveDirectory();
  if (!archive) {
    return fail(MutationStatus::HomeUnavailable,
                "Error: cannot resolve home directory for archive");
  }

  std::error_code ec;
  auto status = std::filesystem::symlink_status(path, ec);
  if (ec || !std::filesystem::is_directory(status)) {
    return fail(MutationStatus::NotFound,
                "Error: " + path + ": no such directory");
  }

  auto safety = PathSafety::checkDeletion(path, m_home);
  if (safety != PathSafety::SafetyStatus::Allowed) {
    return fail(MutationStatus::Protected,
                PathSafety::getStatusMessage(safety, path));
  }

  std::filesystem::create_directories(*archive, ec);
  if (ec) {
    return fail(statusFromError(ec),
                "Error creating archive dir: " + ec.message());
  }

  const std::string destination = joinPath(*archive, baseName(path));
  auto dest_status = std::filesystem::symlink_status(destination, ec);
  if (!ec && std::filesystem::exists(dest_status)) {
    return fail(MutationStatus::AlreadyExists,
                "Error: " + destination + " already exists in archive");
  }

  std::filesystem::rename(path, destination, ec);
  if (ec) {
    return failWithError("rename " + path, ec);
  }

  spdlog::info("archived {} -> {}", path, destination);
  return MutationResult::success();
}

std::optional<std::string> MutationOps::archiveDirectory() const {
  if (!m_archive_dir.empty() && m_archive_dir[0] == '/') {
    return normalizePath(m_archive_dir);
  }
  if (!m_home) {
    return std::nullopt;
  }
  return normalizePath(joinPath(*m_home, m_archive_dir));
}

bool MutationOps::isValidFolderName(const std::string &name) {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  return name.find('/') == std::string::npos &&
         name.find('\0') == std::string::npos;
}

MutationStatus MutationOps::statusFromError(const std::error_code &ec) {
  if (ec == std::errc::file_exists || ec == std::errc::directory_not_empty) {
    return MutationStatus::AlreadyExists;
  }
  if (ec == std::errc::permission_denied ||
      ec == std::errc::operation_not_permitted ||
      ec == std::errc::read_only_file_system) {
    return MutationStatus::PermissionDenied;
  }
  if (ec == std::errc::no_such_file_or_directory) {
    return MutationStatus::NotFound;
  }
  if (ec == std::errc::cross_device_link) {
    return MutationStatus::CrossDevice;
  }
  if (ec == std::errc::filename_too_long || ec == std::errc::invalid_argument) {
    return MutationStatus::InvalidName;
  }
  return MutationStatus::Failed;
}
