#ifndef WALKOPTIONS_HPP
#define WALKOPTIONS_HPP

#include <cstddef>
#include <optional>

/**
 * @brief Limits applied by the TreeWalker while building the tree
 *
 * An empty optional means "no limit". A bound of 0 is a real bound: no
 * files retained, or no subdirectory of the root expanded.
 */
struct WalkOptions {
  /** @brief Files retained per directory; the rest are counted as hidden */
  std::optional<std::size_t> maxFilesPerDir;

  /**
   * @brief Directories at depth < maxDepth are read; their subdirectories
   *        at depth maxDepth are recorded without being read
   */
  std::optional<std::size_t> maxDepth;
};

/**
 * @brief Limits applied when laying out the walked tree for display
 */
struct LayoutOptions {
  /** @brief Members of an identical group expanded before summarizing */
  std::optional<std::size_t> maxDirsPerGroup;
};

#endif // WALKOPTIONS_HPP
