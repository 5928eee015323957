#ifndef NAMEINDEX_HPP
#define NAMEINDEX_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

#include "entry.hpp"
#include "treewalker.hpp"

/**
 * @brief Insertion-ordered mapping from entry name to the paths carrying it
 *
 * Groups appear in the order their name was first seen; paths inside a group
 * appear in discovery order. Both orders come straight from the walk, which
 * is what lets DuplicateFinder treat paths[0] as the original.
 */
class NameIndex {
public:
    struct Group {
        std::string name;
        std::vector<std::filesystem::path> paths;
    };

    void add(const std::string& name, const std::filesystem::path& path);

    const std::vector<Group>& groups() const { return m_groups; }

    /**
     * @brief Look up a group by exact name
     * @return Pointer into the index, or nullptr if the name is unknown
     */
    const Group* find(const std::string& name) const;

    /** @brief Number of distinct names */
    std::size_t size() const { return m_groups.size(); }
    bool empty() const { return m_groups.empty(); }

    /** @brief Number of paths over all groups */
    std::size_t entryCount() const;

private:
    std::vector<Group> m_groups;
    std::unordered_map<std::string, std::size_t> m_positions;
};

/**
 * @brief Selection applied while building a NameIndex
 *
 * kind picks files or directories. name, when set, must match exactly.
 * extension, when set, applies to files only and is compared
 * case-insensitively; it is normalised on assignment through
 * normalizeExtension().
 */
struct IndexFilter {
    Entry::Kind kind = Entry::Kind::File;
    std::string name;
    std::string extension;

    bool matches(const Entry& entry) const;

    /**
     * @brief Trim whitespace, enforce a leading dot and lower-case
     *
     * " JPG" and ".Jpg" both become ".jpg"; an empty string stays empty.
     */
    static std::string normalizeExtension(std::string extension);
};

/**
 * @brief Builds a NameIndex from a tree walk
 *
 * Example usage:
 * @code
 * LocalFileSystem fs;
 * TreeWalker walker(fs);
 * IndexFilter filter;
 * filter.extension = IndexFilter::normalizeExtension(".txt");
 * NameIndex index = NameIndexer::build(walker, "/data", filter);
 * @endcode
 */
class NameIndexer {
public:
    static NameIndex build(const TreeWalker& walker,
                           const std::filesystem::path& root,
                           const IndexFilter& filter);
};

#endif // NAMEINDEX_HPP
