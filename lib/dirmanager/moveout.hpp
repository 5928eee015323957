#ifndef MOVEOUT_HPP
#define MOVEOUT_HPP

#include <filesystem>
#include <optional>
#include <vector>

#include "ifilesystem.hpp"
#include "outcome.hpp"
#include "relocator.hpp"

/**
 * @brief Flattens nested content into the reference directory
 *
 * Two flavours exist:
 * - folder mode: the deepest directory holding at least one file is moved,
 *   as a whole, into the reference directory
 * - file mode: every file that does not already sit directly in the
 *   reference directory is moved into it
 *
 * Both use the collision-safe naming of Relocator.
 *
 * @see Relocator::uniqueDestination()
 */
class MoveOut {
public:
    MoveOut(IFileSystem& fs, Relocator& relocator);

    /**
     * @brief Find the deepest directory that directly contains a file
     *
     * Candidates are root and every directory below it, except the reference
     * directory itself. Depth is the number of path components relative to
     * reference. On a tie the first candidate in walk order wins.
     *
     * @return The chosen directory, or std::nullopt when no directory holds a file
     */
    std::optional<std::filesystem::path>
    findDeepestFolder(const std::filesystem::path& root,
                      const std::filesystem::path& reference) const;

    /**
     * @brief Move the directory chosen by findDeepestFolder() into reference
     * @return The move outcome, or std::nullopt when there was nothing to move
     */
    std::optional<Outcome> moveOutDeepestFolder(const std::filesystem::path& root,
                                                const std::filesystem::path& reference);

    /**
     * @brief Move every nested file below root into reference
     */
    std::vector<Outcome> moveOutFiles(const std::filesystem::path& root,
                                      const std::filesystem::path& reference);

    /**
     * @brief Number of components of path relative to reference
     *
     * "ref/a/b" relative to "ref" is 2; a path outside reference counts its
     * ".." components as well.
     */
    static int relativeDepth(const std::filesystem::path& path,
                             const std::filesystem::path& reference);

private:
    bool containsFile(const std::filesystem::path& dir) const;

    IFileSystem& m_fs;
    Relocator& m_relocator;
};

#endif // MOVEOUT_HPP
