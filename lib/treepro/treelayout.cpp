#include "treelayout.hpp"

#include <algorithm>

#include "dirgrouper.hpp"

namespace {

const char *const kBranch = "├── ";
const char *const kLastBranch = "└── ";
const char *const kPipe = "│   ";
const char *const kBlank = "    ";

} // namespace

std::vector<LayoutItem> TreeLayout::buildItems(const DirectoryNode &dir) const {
  std::vector<LayoutItem> items;
  items.reserve(dir.children.size() + dir.files.size() + 1);

  for (const auto &group : DirGrouper::groupIdentical(dir.children)) {
    std::size_t limit = group.members.size();
    if (m_options.maxDirsPerGroup)
      limit = std::min(limit, *m_options.maxDirsPerGroup);

    for (std::size_t i = 0; i < limit; ++i) {
      const DirectoryNode *member = group.members[i];
      LayoutItem item;
      item.kind =
          member->hasError() ? LineKind::ErrorDirectory : LineKind::Directory;
      item.dir = member;
      items.push_back(item);
    }
    if (group.members.size() > limit) {
      LayoutItem item;
      item.kind = LineKind::CollapsedGroup;
      item.count = group.members.size() - limit;
      items.push_back(item);
    }
  }

  for (const auto &file : dir.files) {
    LayoutItem item;
    item.kind = LineKind::File;
    item.file = &file;
    items.push_back(item);
  }

  if (dir.hiddenFileCount > 0) {
    LayoutItem item;
    item.kind = LineKind::FileSummary;
    item.dir = &dir;
    item.count = dir.hiddenFileCount;
    items.push_back(item);
  }

  return items;
}

void TreeLayout::forEachLine(const DirectoryNode &root,
                             const LineVisitor &visitor) const {
  visitChildren(root, "", visitor);
}

std::string TreeLayout::collapsedLabel(std::size_t omitted) {
  return "... (" + std::to_string(omitted) + " identical dirs)";
}

std::string TreeLayout::fileSummaryLabel(const DirectoryNode &dir) {
  return "... [" + std::to_string(dir.immediateDirCount) + " directories, " +
         std::to_string(dir.immediateFileCount) + " files, showing first " +
         std::to_string(dir.immediateFileCount - dir.hiddenFileCount) + "]";
}

void TreeLayout::visitChildren(const DirectoryNode &dir,
                               const std::string &prefix,
                               const LineVisitor &visitor) const {
  const std::vector<LayoutItem> items = buildItems(dir);

  for (std::size_t idx = 0; idx < items.size(); ++idx) {
    const LayoutItem &item = items[idx];
    const bool isLast = idx + 1 == items.size();

    DisplayLine line;
    line.kind = item.kind;
    line.prefix = prefix;
    line.connector = isLast ? kLastBranch : kBranch;

    switch (item.kind) {
    case LineKind::Directory:
      line.label = item.dir->name;
      line.suffix = "/";
      visitor(line);
      visitChildren(*item.dir, prefix + (isLast ? kBlank : kPipe), visitor);
      break;
    case LineKind::ErrorDirectory:
      line.label = item.dir->name;
      line.suffix = " [" + readErrorLabel(*item.dir->error) + "]";
      line.permissionDenied = item.dir->isPermissionError();
      visitor(line);
      break;
    case LineKind::CollapsedGroup:
      line.label = collapsedLabel(item.count);
      visitor(line);
      break;
    case LineKind::File:
      line.label = item.file->name;
      visitor(line);
      break;
    case LineKind::FileSummary:
      line.label = fileSummaryLabel(*item.dir);
      visitor(line);
      break;
    }
  }
}
