/**
 * @file treewalker.cpp
 * @brief Implementation of the depth-first tree walk
 */

#include "treewalker.hpp"

#include <algorithm>

#include "log.hpp"

namespace fs = std::filesystem;

namespace {

// Display name of the root: the last non-empty component of the cleaned
// path, or the path itself for "/" and similar.
std::string rootName(const fs::path &root) {
  fs::path clean = root.lexically_normal();
  if (!clean.has_filename() && clean.has_relative_path())
    clean = clean.parent_path();
  std::string name = clean.filename().string();
  return name.empty() ? clean.string() : name;
}

} // namespace

DirectoryNode TreeWalker::walk(const fs::path &root,
                               const WalkOptions &options,
                               ProgressCallback progress) {
  m_visited = 0;

  std::error_code ec;
  const fs::file_status status = fs::status(root, ec);
  // ENOTDIR also reports file_type::not_found; it is an unreadable root
  if (ec == std::errc::no_such_file_or_directory) {
    TP_LOGE("root %s does not exist", root.string().c_str());
    throw TreeWalkError(WalkErrorKind::RootNotFound, root, ec.message());
  }
  if (ec) {
    const ReadError error = ReadError::fromErrorCode(ec);
    TP_LOGE("cannot stat root %s: %s", root.string().c_str(),
            ec.message().c_str());
    throw TreeWalkError(WalkErrorKind::RootUnreadable, root, error.message,
                        error.isPermissionDenied());
  }
  if (!fs::is_directory(status)) {
    throw TreeWalkError(WalkErrorKind::RootNotADirectory, root, "");
  }

  checkCancelled(root);

  DirectoryNode node;
  node.name = rootName(root);
  node.path = root.lexically_normal();
  node.depth = 0;

  std::vector<RawEntry> entries;
  if (!readEntries(node.path, entries, ec)) {
    const ReadError error = ReadError::fromErrorCode(ec);
    TP_LOGE("cannot read root %s: %s", root.string().c_str(),
            ec.message().c_str());
    throw TreeWalkError(WalkErrorKind::RootUnreadable, root, error.message,
                        error.isPermissionDenied());
  }
  markVisited(progress);

  TP_LOGI("walking %s", node.path.string().c_str());
  buildNode(node, entries, options, progress);
  TP_LOGI("walk finished: %zu directories read, %zu dirs, %zu files",
          m_visited, node.totalDirCount, node.totalFileCount);
  return node;
}

bool TreeWalker::readEntries(const fs::path &dir,
                             std::vector<RawEntry> &entries,
                             std::error_code &ec) {
  entries.clear();
  fs::directory_iterator it(dir, ec);
  const fs::directory_iterator end;
  while (!ec && it != end) {
    // symlink_status: a link to a directory is listed as a file
    std::error_code type_ec;
    const fs::file_status st = it->symlink_status(type_ec);
    entries.push_back(
        RawEntry{it->path().filename().string(),
                 !type_ec && fs::is_directory(st)});
    it.increment(ec);
  }
  return !ec;
}

DirectoryNode TreeWalker::walkDirectory(const fs::path &path,
                                        const std::string &name,
                                        std::size_t depth,
                                        const WalkOptions &options,
                                        const ProgressCallback &progress) {
  checkCancelled(path);

  DirectoryNode node;
  node.name = name;
  node.path = path;
  node.depth = depth;

  std::vector<RawEntry> entries;
  std::error_code ec;
  if (!readEntries(path, entries, ec)) {
    node.error = ReadError::fromErrorCode(ec);
    node.signature = m_fingerprint.forError(path, node.error->kind);
    TP_LOGW("skipping unreadable directory %s: %s", path.string().c_str(),
            ec.message().c_str());
    return node;
  }
  markVisited(progress);

  buildNode(node, entries, options, progress);
  return node;
}

void TreeWalker::buildNode(DirectoryNode &node, std::vector<RawEntry> &entries,
                           const WalkOptions &options,
                           const ProgressCallback &progress) {
  std::sort(entries.begin(), entries.end(),
            [](const RawEntry &a, const RawEntry &b) { return a.name < b.name; });

  const std::size_t childDepth = node.depth + 1;
  const bool atDepthLimit =
      options.maxDepth.has_value() && childDepth >= *options.maxDepth;

  ExtensionHistogram histogram;
  for (const auto &entry : entries) {
    if (entry.isDir) {
      const fs::path childPath = node.path / entry.name;
      if (atDepthLimit) {
        node.children.push_back(
            unknownContentsNode(childPath, entry.name, childDepth));
      } else {
        node.children.push_back(walkDirectory(childPath, entry.name,
                                              childDepth, options, progress));
      }
      continue;
    }

    // Histogram covers every file, retained or not
    ++histogram[Fingerprint::normalizeExtension(entry.name)];

    if (!options.maxFilesPerDir || node.files.size() < *options.maxFilesPerDir) {
      node.files.push_back(FileEntry{entry.name});
    } else {
      ++node.hiddenFileCount;
    }
  }

  node.immediateDirCount = node.children.size();
  node.immediateFileCount = node.files.size() + node.hiddenFileCount;

  node.totalDirCount = node.immediateDirCount;
  node.totalFileCount = node.immediateFileCount;
  std::vector<std::string> childSignatures;
  childSignatures.reserve(node.children.size());
  for (const auto &child : node.children) {
    node.totalDirCount += child.totalDirCount;
    node.totalFileCount += child.totalFileCount;
    childSignatures.push_back(child.signature);
  }

  node.signature =
      m_fingerprint.forDirectory(histogram, std::move(childSignatures));
}

DirectoryNode TreeWalker::unknownContentsNode(const fs::path &path,
                                              const std::string &name,
                                              std::size_t depth) const {
  DirectoryNode node;
  node.name = name;
  node.path = path;
  node.depth = depth;
  node.unknownContents = true;
  node.signature = m_fingerprint.forUnknownContents(path);
  return node;
}

void TreeWalker::checkCancelled(const fs::path &path) const {
  if (m_cancel_flag && m_cancel_flag->load()) {
    throw TreeWalkError(WalkErrorKind::Cancelled, path, "");
  }
}

void TreeWalker::markVisited(const ProgressCallback &progress) {
  ++m_visited;
  if (progress)
    progress(m_visited);
}
