#include "walkerror.hpp"

TreeWalkError::TreeWalkError(WalkErrorKind kind,
                             const std::filesystem::path &path,
                             const std::string &detail, bool permissionDenied)
    : std::runtime_error(getStatusMessage(kind, path, detail)), m_kind(kind),
      m_path(path), m_permissionDenied(permissionDenied) {}

std::string TreeWalkError::getStatusMessage(WalkErrorKind kind,
                                            const std::filesystem::path &path,
                                            const std::string &detail) {
  const std::string where = path.string();
  switch (kind) {
  case WalkErrorKind::RootNotFound:
    return where + ": no such file or directory";
  case WalkErrorKind::RootUnreadable:
    return where + ": " + (detail.empty() ? "cannot read directory" : detail);
  case WalkErrorKind::RootNotADirectory:
    return where + " is not a directory";
  case WalkErrorKind::Cancelled:
    return "walk cancelled at " + where;
  }
  return where + ": " + detail;
}
