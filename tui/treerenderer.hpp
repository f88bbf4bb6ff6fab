/**
 * @file treerenderer.hpp
 * @brief Colored terminal output of the tree diagram using FTXUI
 *
 * Each display line is rendered into its own one-row FTXUI screen and
 * written out, so arbitrarily tall trees are printed in full instead of
 * being clipped to the terminal height.
 *
 * Color scheme:
 * - Directories: blue, bold
 * - Files: white
 * - Summaries and permission annotations: dim
 * - Other read errors: red, bold
 * - Footer: green, bold
 *
 * @see TreeLayout
 * @see TreePrinter
 */

#ifndef TREERENDERER_HPP
#define TREERENDERER_HPP

#include <ftxui/dom/elements.hpp>
#include <ostream>
#include <string>

#include "direntry.hpp"
#include "treelayout.hpp"
#include "walkoptions.hpp"

class TreeRenderer {
public:
  /**
   * @brief Writes root label, tree lines and footer with ANSI styling
   */
  static void render(std::ostream &out, const std::string &rootLabel,
                     const DirectoryNode &root, const LayoutOptions &options);

  /** @brief Styled element for one display line */
  static ftxui::Element lineElement(const DisplayLine &line);

private:
  static void emit(std::ostream &out, ftxui::Element element,
                   const std::string &plainText);
};

#endif // TREERENDERER_HPP
