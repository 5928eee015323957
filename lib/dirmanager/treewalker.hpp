/**
 * @file treewalker.hpp
 * @brief Depth-first directory traversal producing Entry objects
 *
 * This header defines the TreeWalker class, the leaf component every other
 * dirmanager operation builds on.
 */

#ifndef TREEWALKER_HPP
#define TREEWALKER_HPP

#include <filesystem>
#include <functional>
#include <system_error>
#include <utility>
#include <vector>

#include "entry.hpp"
#include "ifilesystem.hpp"

/**
 * @class TreeWalker
 * @brief Recursively enumerates a directory tree in a stable order
 *
 * TreeWalker visits every file and directory below a root. The root itself
 * is not reported. Traversal is depth-first with the parent reported before
 * its children, and the children of each directory are visited in the
 * sorted order returned by IFileSystem::listDirectory().
 *
 * Key properties:
 * - Deterministic order for a given tree
 * - Unlistable directories are reported through the error callback and
 *   skipped; the walk continues with their siblings
 * - Symbolic links to directories are reported as directories but never
 *   descended into
 *
 * @see Entry
 * @see IFileSystem
 */
class TreeWalker {
private:
  /** @brief Filesystem used for listing and kind queries */
  const IFileSystem &m_fs;

  /** @brief Optional sink for directories that could not be listed */
  std::function<void(const std::filesystem::path &, const std::error_code &)>
      m_onError;

  /** @brief Directories skipped together with everything below them */
  std::vector<std::filesystem::path> m_excluded;

public:
  /**
   * @brief Callback invoked once per discovered entry, in walk order
   */
  using Visitor = std::function<void(const Entry &entry)>;

  /**
   * @brief Callback invoked when a directory cannot be listed
   */
  using ErrorCallback = std::function<void(const std::filesystem::path &dir,
                                           const std::error_code &ec)>;

  /**
   * @brief Constructs a walker over the given filesystem
   *
   * @param fs Filesystem implementation; must outlive the walker
   */
  explicit TreeWalker(const IFileSystem &fs) : m_fs(fs) {}

  /**
   * @brief Installs the callback used for unlistable directories
   *
   * Without a callback such directories are skipped silently.
   */
  void setErrorCallback(ErrorCallback callback) {
    m_onError = std::move(callback);
  }

  /**
   * @brief Leaves a directory and its subtree out of every walk
   *
   * Used to keep the tool's own output directory (reports, moved duplicates)
   * from being picked up when it lies inside the scanned tree. Paths are
   * compared after lexical normalisation, so pass absolute paths when the
   * root is absolute.
   */
  void exclude(const std::filesystem::path &dir) {
    auto normal = dir.lexically_normal();
    if (!normal.has_filename() && normal.has_parent_path())
      normal = normal.parent_path(); // "reports/" -> "reports"
    m_excluded.push_back(normal);
  }

  /**
   * @brief Walks the tree below root and calls visit for each entry
   *
   * @param root Directory whose contents are enumerated (depth 0)
   * @param visit Called with every file and directory, parents first
   *
   * @note The caller is expected to have checked that root is a directory
   * @note Implementation is in treewalker.cpp
   */
  void walk(const std::filesystem::path &root, const Visitor &visit) const;

  /**
   * @brief Convenience wrapper returning the walk as a vector
   */
  std::vector<Entry> collect(const std::filesystem::path &root) const;

private:
  void walkDirectory(const std::filesystem::path &dir, int depth,
                     const Visitor &visit) const;
  bool isExcluded(const std::filesystem::path &p) const;
};

#endif // TREEWALKER_HPP
