/**
 * @file treelayout.hpp
 * @brief Turns a walked tree into a sequence of display lines
 *
 * The layout decides what is shown: identical groups are truncated to the
 * per-group limit, hidden files are summarized, and errored directories get
 * an annotation instead of children. How a line is drawn (plain text or
 * colored terminal output) is left to the printers.
 *
 * @see TreePrinter
 * @see TreeRenderer
 */

#ifndef TREELAYOUT_HPP
#define TREELAYOUT_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "direntry.hpp"
#include "walkoptions.hpp"

/**
 * @enum LineKind
 * @brief What a display line stands for
 */
enum class LineKind {
  Directory,      ///< Expanded directory, followed by its own lines
  ErrorDirectory, ///< Directory that could not be read
  CollapsedGroup, ///< "... (N identical dirs)"
  File,           ///< Retained file
  FileSummary     ///< "... [D directories, F files, showing first S]"
};

/**
 * @brief One entry of a directory's listing, before prefixes are applied
 */
struct LayoutItem {
  LineKind kind = LineKind::File;
  const DirectoryNode *dir = nullptr;
  const FileEntry *file = nullptr;
  /** @brief Omitted directories for CollapsedGroup, hidden files for FileSummary */
  std::size_t count = 0;
};

/**
 * @brief A fully positioned line of the tree diagram
 *
 * The line reads prefix + connector + label + suffix. Printers style the
 * label and suffix according to @c kind.
 */
struct DisplayLine {
  LineKind kind = LineKind::File;
  std::string prefix;
  std::string connector;
  std::string label;
  std::string suffix;
  /** @brief Set for ErrorDirectory lines caused by a permission failure */
  bool permissionDenied = false;
};

/**
 * @class TreeLayout
 * @brief Produces display lines for a DirectoryNode tree, one at a time
 */
class TreeLayout {
private:
  LayoutOptions m_options;

public:
  using LineVisitor = std::function<void(const DisplayLine &line)>;

  explicit TreeLayout(const LayoutOptions &options) : m_options(options) {}

  /**
   * @brief Listing of a single directory, in display order
   *
   * Order: identical groups in first-seen order (each truncated to
   * maxDirsPerGroup, followed by a CollapsedGroup item when members were
   * omitted), then retained files, then a FileSummary item when files were
   * hidden.
   */
  std::vector<LayoutItem> buildItems(const DirectoryNode &dir) const;

  /**
   * @brief Visits every line below @p root in depth-first display order
   *
   * The root itself is not emitted; callers print their own root label.
   */
  void forEachLine(const DirectoryNode &root, const LineVisitor &visitor) const;

  /** @brief Text of a CollapsedGroup line */
  static std::string collapsedLabel(std::size_t omitted);

  /** @brief Text of a FileSummary line for @p dir */
  static std::string fileSummaryLabel(const DirectoryNode &dir);

private:
  void visitChildren(const DirectoryNode &dir, const std::string &prefix,
                     const LineVisitor &visitor) const;
};

#endif // TREELAYOUT_HPP
