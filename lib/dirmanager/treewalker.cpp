/**
 * @file treewalker.cpp
 * @brief Implementation of the depth-first tree walk
 */

#include "treewalker.hpp"

namespace fs = std::filesystem;

void TreeWalker::walk(const fs::path &root, const Visitor &visit) const {
  walkDirectory(root, 1, visit);
}

std::vector<Entry> TreeWalker::collect(const fs::path &root) const {
  std::vector<Entry> results;
  walk(root, [&results](const Entry &entry) { results.push_back(entry); });
  return results;
}

/**
 * @brief Visits the children of dir, recursing into each subdirectory
 *
 * Each child directory is reported before anything inside it. A listing
 * failure ends this branch only.
 *
 * @param dir Directory to list
 * @param depth Depth assigned to the children of dir
 * @param visit Entry callback
 */
void TreeWalker::walkDirectory(const fs::path &dir, int depth,
                               const Visitor &visit) const {
  std::vector<fs::path> children;
  if (auto ec = m_fs.listDirectory(dir, children)) {
    if (m_onError) {
      m_onError(dir, ec);
    }
    return;
  }

  for (const auto &child : children) {
    if (isExcluded(child))
      continue;

    if (m_fs.isDirectory(child)) {
      visit(Entry(child, Entry::Kind::Directory, depth));

      // Linked directories are listed but not followed
      if (!m_fs.isSymlink(child)) {
        walkDirectory(child, depth + 1, visit);
      }
    } else {
      visit(Entry(child, Entry::Kind::File, depth));
    }
  }
}

bool TreeWalker::isExcluded(const fs::path &p) const {
  if (m_excluded.empty())
    return false;

  const auto normal = p.lexically_normal();
  for (const auto &excluded : m_excluded) {
    if (normal == excluded)
      return true;
  }
  return false;
}
