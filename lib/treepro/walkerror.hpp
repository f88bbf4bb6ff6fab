#ifndef WALKERROR_HPP
#define WALKERROR_HPP

#include <filesystem>
#include <stdexcept>
#include <string>

/**
 * @brief Whole-walk failures. No tree is produced when one of these occurs.
 */
enum class WalkErrorKind {
  RootNotFound,
  RootUnreadable,
  RootNotADirectory,
  Cancelled
};

/**
 * @class TreeWalkError
 * @brief Thrown by TreeWalker::walk() when the walk cannot produce a tree
 *
 * Failures below the root are never reported this way; they are recorded on
 * the affected DirectoryNode instead.
 */
class TreeWalkError : public std::runtime_error {
private:
  WalkErrorKind m_kind;
  std::filesystem::path m_path;
  bool m_permissionDenied;

public:
  TreeWalkError(WalkErrorKind kind, const std::filesystem::path &path,
                const std::string &detail, bool permissionDenied = false);

  WalkErrorKind getKind() const { return m_kind; }
  const std::filesystem::path &getPath() const { return m_path; }
  bool isPermissionDenied() const { return m_permissionDenied; }

  /**
   * @brief Human-readable message for a walk error
   */
  static std::string getStatusMessage(WalkErrorKind kind,
                                      const std::filesystem::path &path,
                                      const std::string &detail);
};

#endif // WALKERROR_HPP
