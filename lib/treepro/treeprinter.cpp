#include "treeprinter.hpp"

void TreePrinter::print(std::ostream &out, const std::string &rootLabel,
                        const DirectoryNode &root,
                        const LayoutOptions &options) {
  out << rootLabel << '\n';

  TreeLayout layout(options);
  layout.forEachLine(root, [&out](const DisplayLine &line) {
    out << formatLine(line) << '\n';
  });

  out << footer(root) << '\n';
}

std::string TreePrinter::formatLine(const DisplayLine &line) {
  return line.prefix + line.connector + line.label + line.suffix;
}

std::string TreePrinter::footer(const DirectoryNode &root) {
  return "[" + std::to_string(root.totalDirCount + 1) + " directories, " +
         std::to_string(root.totalFileCount) + " files]";
}
