/**
 * @file treewalker.hpp
 * @brief Depth-first construction of the annotated directory tree
 *
 * This header defines the TreeWalker class, which reads a directory subtree,
 * applies the file and depth limits, and computes every node's counts and
 * structural signature bottom-up.
 */

#ifndef TREEWALKER_HPP
#define TREEWALKER_HPP

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <system_error>
#include <vector>

#include "direntry.hpp"
#include "fingerprint.hpp"
#include "ihashcalculator.hpp"
#include "walkerror.hpp"
#include "walkoptions.hpp"

/**
 * @class TreeWalker
 * @brief Walks a directory subtree into a DirectoryNode tree
 *
 * The walk is post-order: every subdirectory is finished, signature
 * included, before its parent's signature is computed. Entries are sorted
 * by name, so the resulting tree does not depend on the order the operating
 * system returns them in.
 *
 * Key behavior:
 * - Files beyond WalkOptions::maxFilesPerDir are counted as hidden but still
 *   take part in counts and signatures
 * - Subdirectories at the depth limit are recorded as unknown-contents
 *   nodes and never read
 * - An unreadable subdirectory is recorded on its node and the walk goes on
 *   with its siblings; only a failure on the root aborts the walk
 * - Symlinks are treated as files and never followed
 *
 * @see Fingerprint
 * @see DirectoryNode
 */
class TreeWalker {
private:
  /** @brief Signature engine, bound to the injected hash calculator */
  Fingerprint m_fingerprint;

  /** @brief Optional flag checked before each directory is read */
  std::atomic<bool> *m_cancel_flag = nullptr;

  /** @brief Directories read during the current walk */
  std::size_t m_visited = 0;

public:
  /**
   * @brief Callback function type for progress notifications
   *
   * Function signature: void(std::size_t visited)
   * - visited: Number of directories read so far
   */
  using ProgressCallback = std::function<void(std::size_t visited)>;

  /**
   * @brief Constructs a TreeWalker using the given hash calculator for
   *        signatures
   *
   * @note The calculator reference must remain valid for the lifetime of
   *       the TreeWalker object
   */
  explicit TreeWalker(const IHashCalculator &calculator)
      : m_fingerprint(calculator) {}

  /**
   * @brief Sets a flag that aborts the walk when it becomes true
   *
   * The flag is checked between directory visits. It may be set from a
   * signal handler or another thread.
   *
   * @param flag Pointer to the flag, or nullptr to disable cancellation
   */
  void setCancelFlag(std::atomic<bool> *flag) { m_cancel_flag = flag; }

  /**
   * @brief Walks the subtree rooted at @p root
   *
   * @param root Directory to walk
   * @param options File and depth limits
   * @param progress Optional callback invoked after each directory is read
   *
   * @return The fully annotated root node
   *
   * @throws TreeWalkError RootNotFound, RootUnreadable or RootNotADirectory
   *         when the root cannot be walked; Cancelled when the cancel flag
   *         was raised
   */
  DirectoryNode walk(const std::filesystem::path &root,
                     const WalkOptions &options,
                     ProgressCallback progress = nullptr);

private:
  /** @brief Name and type of a directory entry, as read from the OS */
  struct RawEntry {
    std::string name;
    bool isDir = false;
  };

  /**
   * @brief Lists a directory without following symlinks
   *
   * @return false and sets @p ec if the directory could not be fully listed
   */
  static bool readEntries(const std::filesystem::path &dir,
                          std::vector<RawEntry> &entries,
                          std::error_code &ec);

  /**
   * @brief Reads and builds a non-root directory; read failures are
   *        recorded on the returned node
   */
  DirectoryNode walkDirectory(const std::filesystem::path &path,
                              const std::string &name, std::size_t depth,
                              const WalkOptions &options,
                              const ProgressCallback &progress);

  /**
   * @brief Fills children, files, counts and signature of @p node from its
   *        listed entries
   */
  void buildNode(DirectoryNode &node, std::vector<RawEntry> &entries,
                 const WalkOptions &options, const ProgressCallback &progress);

  /** @brief Node for a subdirectory skipped by the depth limit */
  DirectoryNode unknownContentsNode(const std::filesystem::path &path,
                                    const std::string &name,
                                    std::size_t depth) const;

  /** @brief Throws TreeWalkError(Cancelled) when the cancel flag is set */
  void checkCancelled(const std::filesystem::path &path) const;

  /** @brief Counts a visited directory and reports progress */
  void markVisited(const ProgressCallback &progress);
};

#endif // TREEWALKER_HPP
