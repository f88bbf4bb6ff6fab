/**
 * @file direntry.hpp
 * @brief In-memory directory tree produced by the TreeWalker
 *
 * Defines the value types the walker builds and the layout consumes:
 * FileEntry, ReadError and DirectoryNode. Each node owns its children by
 * value, so the tree has no shared or back references.
 *
 * @see TreeWalker
 * @see TreeLayout
 */

#ifndef DIRENTRY_HPP
#define DIRENTRY_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

/**
 * @brief A file retained for display. Only the name is kept.
 */
struct FileEntry {
  std::string name;
};

/**
 * @enum ReadErrorKind
 * @brief Category of a failed directory read
 *
 * PermissionDenied is rendered with its own label; every other failure is
 * opaque and shown with the message reported by the operating system.
 */
enum class ReadErrorKind { PermissionDenied, Other };

/**
 * @brief Failure recorded on a directory that could not be listed
 */
struct ReadError {
  ReadErrorKind kind = ReadErrorKind::Other;
  std::string message;

  /**
   * @brief Builds a ReadError from a std::error_code returned by the
   *        filesystem library
   */
  static ReadError fromErrorCode(const std::error_code &ec) {
    ReadError error;
    if (ec == std::errc::permission_denied ||
        ec == std::errc::operation_not_permitted) {
      error.kind = ReadErrorKind::PermissionDenied;
    }
    error.message = ec.message();
    return error;
  }

  bool isPermissionDenied() const {
    return kind == ReadErrorKind::PermissionDenied;
  }
};

/**
 * @brief Stable token for an error category, used in error signatures
 */
inline const char *readErrorKindName(ReadErrorKind kind) {
  switch (kind) {
  case ReadErrorKind::PermissionDenied:
    return "permission";
  case ReadErrorKind::Other:
    break;
  }
  return "other";
}

/**
 * @brief Text shown inside the bracketed annotation of an errored directory
 *
 * Permission failures get a fixed label; other failures show the trimmed
 * OS message, or "error" when the message is blank.
 */
std::string readErrorLabel(const ReadError &error);

/**
 * @struct DirectoryNode
 * @brief One directory level of the walked tree
 *
 * Counts always describe the real filesystem contents. Display truncation
 * only affects @c files and @c hiddenFileCount, never the totals.
 *
 * Totals cover the subtree below this node and do not include the node
 * itself, so a root with two empty subdirectories has totalDirCount == 2.
 */
struct DirectoryNode {
  /** @brief Basename used for display */
  std::string name;

  /** @brief Resolved path, for error context and signature derivation */
  std::filesystem::path path;

  /** @brief 0 at the root, +1 per level */
  std::size_t depth = 0;

  /** @brief Subdirectories, sorted by name */
  std::vector<DirectoryNode> children;

  /** @brief Files kept for display, bounded by the per-directory limit */
  std::vector<FileEntry> files;

  std::size_t hiddenFileCount = 0;
  std::size_t immediateDirCount = 0;
  std::size_t immediateFileCount = 0;
  std::size_t totalDirCount = 0;
  std::size_t totalFileCount = 0;

  /** @brief Structural signature; empty until the subtree is complete */
  std::string signature;

  /** @brief Set when the directory could not be listed */
  std::optional<ReadError> error;

  /** @brief Recorded because of the depth limit; never read */
  bool unknownContents = false;

  bool hasError() const { return error.has_value(); }

  bool isPermissionError() const {
    return error.has_value() && error->isPermissionDenied();
  }
};

#endif // DIRENTRY_HPP
