#ifndef TREEPRINTER_HPP
#define TREEPRINTER_HPP

#include <ostream>
#include <string>

#include "direntry.hpp"
#include "treelayout.hpp"
#include "walkoptions.hpp"

/**
 * @brief Plain-text output of a walked tree, without terminal styling
 *
 * Output is the root label, one line per DisplayLine, then the footer.
 */
class TreePrinter {
public:
  static void print(std::ostream &out, const std::string &rootLabel,
                    const DirectoryNode &root, const LayoutOptions &options);

  /** @brief prefix + connector + label + suffix */
  static std::string formatLine(const DisplayLine &line);

  /**
   * @brief "[T directories, F files]", where T includes the root itself
   */
  static std::string footer(const DirectoryNode &root);
};

#endif // TREEPRINTER_HPP
