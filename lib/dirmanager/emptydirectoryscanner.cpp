/**
 * @file emptydirectoryscanner.cpp
 * @brief Implementation of empty directory reporting and pruning
 */

#include "emptydirectoryscanner.hpp"
#include "treewalker.hpp"

namespace fs = std::filesystem;

namespace {

bool samePath(const fs::path &a, const fs::path &b) {
  auto na = a.lexically_normal();
  auto nb = b.lexically_normal();
  if (!na.has_filename() && na.has_parent_path())
    na = na.parent_path();
  if (!nb.has_filename() && nb.has_parent_path())
    nb = nb.parent_path();
  return na == nb;
}

} // namespace

std::vector<fs::path>
EmptyDirectoryScanner::findEmpty(const fs::path &root) const {
  std::vector<fs::path> empty;
  std::vector<fs::path> children;

  if (!m_fs.listDirectory(root, children) && children.empty()) {
    empty.push_back(root);
  }

  TreeWalker walker(m_fs);
  walker.walk(root, [&](const Entry &entry) {
    if (!entry.isDirectory() || m_fs.isSymlink(entry.getPath()))
      return;

    if (!m_fs.listDirectory(entry.getPath(), children) && children.empty()) {
      empty.push_back(entry.getPath());
    }
  });

  return empty;
}

std::vector<Outcome> EmptyDirectoryScanner::pruneEmpty(const fs::path &root,
                                                       const fs::path &protect) {
  std::vector<Outcome> outcomes;
  pruneDirectory(root, protect, outcomes);
  return outcomes;
}

/**
 * @brief Post-order step of pruneEmpty()
 *
 * Subdirectories are pruned first; dir is listed again afterwards so that
 * the removals just made are taken into account.
 */
void EmptyDirectoryScanner::pruneDirectory(const fs::path &dir,
                                           const fs::path &protect,
                                           std::vector<Outcome> &outcomes) {
  std::vector<fs::path> children;
  if (auto ec = m_fs.listDirectory(dir, children)) {
    outcomes.push_back(
        Outcome::failed(dir, Outcome::Action::Delete, ec.message(), true));
    return;
  }

  for (const auto &child : children) {
    if (m_fs.isDirectory(child) && !m_fs.isSymlink(child)) {
      pruneDirectory(child, protect, outcomes);
    }
  }

  if (samePath(dir, protect))
    return;

  if (m_fs.listDirectory(dir, children) || !children.empty())
    return;

  const auto status = m_guard.checkRemoval(dir);
  if (status != PathGuard::RemovalStatus::Allowed) {
    outcomes.push_back(Outcome::failed(
        dir, Outcome::Action::Delete,
        PathGuard::getStatusMessage(status, dir.string()), true));
    return;
  }

  if (auto ec = m_fs.removeEmptyDirectory(dir)) {
    outcomes.push_back(
        Outcome::failed(dir, Outcome::Action::Delete, ec.message(), true));
    return;
  }
  outcomes.push_back(Outcome::deleted(dir, true));
}
