/**
 * @file emptydirectoryscanner.hpp
 * @brief Detection and bottom-up removal of empty directories
 */

#ifndef EMPTYDIRECTORYSCANNER_HPP
#define EMPTYDIRECTORYSCANNER_HPP

#include <filesystem>
#include <vector>

#include "ifilesystem.hpp"
#include "outcome.hpp"
#include "pathguard.hpp"

/**
 * @class EmptyDirectoryScanner
 * @brief Finds and prunes directories that have no entries
 *
 * A directory is empty when it holds neither files nor subdirectories.
 * findEmpty() only reports; pruneEmpty() deletes, children first, so that a
 * parent left empty by the removal of its children is removed as well.
 * Every removal is checked against the PathGuard first, the same way
 * Relocator checks its moves and deletes.
 *
 * @see Outcome
 * @see PathGuard
 */
class EmptyDirectoryScanner {
private:
  IFileSystem &m_fs;
  const PathGuard &m_guard;

public:
  EmptyDirectoryScanner(IFileSystem &fs, const PathGuard &guard)
      : m_fs(fs), m_guard(guard) {}

  /**
   * @brief Lists the empty directories under and including root
   *
   * Each directory is judged by its contents at the moment it is visited.
   * Directories that would become empty once their empty children are gone
   * are not reported.
   *
   * @param root Directory to scan; reported itself when it is empty
   *
   * @return Empty directories in walk order (root first)
   */
  std::vector<std::filesystem::path>
  findEmpty(const std::filesystem::path &root) const;

  /**
   * @brief Removes empty directories below root, deepest first
   *
   * @param root Directory to prune
   * @param protect Directory that is never removed, even when it ends up
   *                empty (normally root itself)
   *
   * @return One Outcome per attempted removal, refused directory or
   *         unlistable directory
   */
  std::vector<Outcome> pruneEmpty(const std::filesystem::path &root,
                                  const std::filesystem::path &protect);

  /**
   * @brief Same as pruneEmpty(root, root)
   */
  std::vector<Outcome> pruneEmpty(const std::filesystem::path &root) {
    return pruneEmpty(root, root);
  }

private:
  void pruneDirectory(const std::filesystem::path &dir,
                      const std::filesystem::path &protect,
                      std::vector<Outcome> &outcomes);
};

#endif // EMPTYDIRECTORYSCANNER_HPP
