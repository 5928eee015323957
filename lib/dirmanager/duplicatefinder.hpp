#ifndef DUPLICATEFINDER_HPP
#define DUPLICATEFINDER_HPP

#include "nameindex.hpp"
#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Service for duplicate detection based on entry names
 *
 * DuplicateFinder turns a NameIndex into duplicate groups. Entries that share
 * a name are considered duplicates of each other. The class provides
 * functionality to:
 * - Extract the groups that contain more than one path
 * - Select the paths to act on: every duplicate, or every indexed item
 *
 * The first path of every group is the original. It is the first occurrence
 * discovered by the walk, not the alphabetically smallest nor the newest one.
 *
 * @see NameIndex
 * @see DuplicateGroup
 *
 * Example usage:
 * @code
 * NameIndex index = NameIndexer::build(walker, "/path", filter);
 * auto groups = DuplicateFinder::findDuplicates(index);
 * auto batch = DuplicateFinder::duplicatePaths(groups);
 * @endcode
 */
class DuplicateFinder {
public:
    struct DuplicateGroup {
        std::string name;
        std::vector<std::filesystem::path> paths;

        const std::filesystem::path& original() const { return paths.front(); }
        std::size_t duplicateCount() const { return paths.size() - 1; }
    };

    /**
     * @brief Find names carried by more than one path
     * @param index Index to analyze (left untouched)
     * @return Duplicate groups, in index order
     */
    static std::vector<DuplicateGroup> findDuplicates(const NameIndex& index) {
        std::vector<DuplicateGroup> groups;
        for (const auto& group : index.groups()) {
            if (group.paths.size() > 1) {
                groups.push_back(DuplicateGroup{group.name, group.paths});
            }
        }
        return groups;
    }

    /**
     * @brief Every path except the original of each group
     */
    static std::vector<std::filesystem::path>
    duplicatePaths(const std::vector<DuplicateGroup>& groups) {
        std::vector<std::filesystem::path> paths;
        for (const auto& group : groups) {
            paths.insert(paths.end(), group.paths.begin() + 1, group.paths.end());
        }
        return paths;
    }

    /**
     * @brief Every indexed path, originals included (used by --all)
     */
    static std::vector<std::filesystem::path> allPaths(const NameIndex& index) {
        std::vector<std::filesystem::path> paths;
        for (const auto& group : index.groups()) {
            paths.insert(paths.end(), group.paths.begin(), group.paths.end());
        }
        return paths;
    }

    /**
     * @brief Total number of paths that are not originals
     */
    static std::size_t countDuplicates(const std::vector<DuplicateGroup>& groups) {
        std::size_t total = 0;
        for (const auto& group : groups) {
            total += group.duplicateCount();
        }
        return total;
    }
};

#endif // DUPLICATEFINDER_HPP
