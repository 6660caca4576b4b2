#ifndef IMUTATIONOPS_HPP
#define IMUTATIONOPS_HPP

#include <string>

/**
 * @brief Outcome category of a filesystem mutation
 */
enum class MutationStatus {
  Ok,
  AlreadyExists,
  InvalidName,
  NotFound,
  PermissionDenied,
  CrossDevice,
  HomeUnavailable,
  Protected,
  Failed
};

/**
 * @brief Result of a create/delete/archive call
 *
 * On failure, m_message holds the text shown in the browser's status line.
 */
struct MutationResult {
  MutationStatus m_status = MutationStatus::Ok;
  std::string m_message;

  bool ok() const { return m_status == MutationStatus::Ok; }

  static MutationResult success() { return {}; }
  static MutationResult failure(MutationStatus status,
                                const std::string &message) {
    return {status, message};
  }
};

/**
 * @brief The three filesystem-changing actions of the browser
 *
 * All calls are synchronous and single-shot. Implementations must not
 * throw: every failure is returned as a MutationResult.
 */
class IMutationOps {
public:
  virtual MutationResult createFolder(const std::string &parent,
                                      const std::string &name) = 0;
  virtual MutationResult deleteFolder(const std::string &path) = 0;
  virtual MutationResult archiveFolder(const std::string &path) = 0;
  virtual ~IMutationOps() = default;
};

#endif // IMUTATIONOPS_HPP
