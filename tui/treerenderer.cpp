#include "treerenderer.hpp"

#include <algorithm>
#include <ftxui/screen/screen.hpp>
#include <ftxui/screen/string.hpp>

#include "treeprinter.hpp"

using namespace ftxui;

void TreeRenderer::render(std::ostream &out, const std::string &rootLabel,
                          const DirectoryNode &root,
                          const LayoutOptions &options) {
  emit(out, text(rootLabel) | bold | color(Color::Blue), rootLabel);

  TreeLayout layout(options);
  layout.forEachLine(root, [&out](const DisplayLine &line) {
    emit(out, lineElement(line), TreePrinter::formatLine(line));
  });

  const std::string footer = TreePrinter::footer(root);
  emit(out, text(footer) | bold | color(Color::Green), footer);
}

Element TreeRenderer::lineElement(const DisplayLine &line) {
  Element lead = text(line.prefix + line.connector);

  switch (line.kind) {
  case LineKind::Directory:
    return hbox({lead, text(line.label) | bold | color(Color::Blue),
                 text(line.suffix)});
  case LineKind::ErrorDirectory: {
    Element annotation = line.permissionDenied
                             ? text(line.suffix) | dim
                             : text(line.suffix) | bold | color(Color::Red);
    return hbox({lead, text(line.label) | bold | color(Color::Blue),
                 annotation});
  }
  case LineKind::CollapsedGroup:
  case LineKind::FileSummary:
    return hbox({lead, text(line.label) | dim});
  case LineKind::File:
    break;
  }
  return hbox({lead, text(line.label) | color(Color::White)});
}

void TreeRenderer::emit(std::ostream &out, Element element,
                        const std::string &plainText) {
  const int width = std::max(1, string_width(plainText));
  auto screen = Screen::Create(Dimension::Fixed(width), Dimension::Fixed(1));
  Render(screen, element);
  out << screen.ToString() << '\n';
}
