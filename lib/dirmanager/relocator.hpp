/**
 * @file relocator.hpp
 * @brief Collision-safe batch move and delete
 */

#ifndef RELOCATOR_HPP
#define RELOCATOR_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "ifilesystem.hpp"
#include "outcome.hpp"
#include "pathguard.hpp"

/**
 * @class Relocator
 * @brief Moves or deletes a batch of paths, one Outcome per path
 *
 * A batch never aborts early and nothing is rolled back: an item that fails
 * is reported and the next item is processed. Every path is checked again
 * right before it is touched:
 * - a path that no longer exists yields Outcome::Status::SkippedMissing
 * - a path refused by the PathGuard yields Outcome::Status::Failed
 *
 * @see Outcome
 * @see PathGuard
 */
class Relocator {
public:
    enum class Mode { Move, Delete };

    Relocator(IFileSystem& fs, const PathGuard& guard);

    /**
     * @brief Process paths in input order
     * @param destination Target directory; ignored for Mode::Delete
     */
    std::vector<Outcome> relocate(const std::vector<std::filesystem::path>& paths,
                                  const std::filesystem::path& destination,
                                  Mode mode);

    /**
     * @brief Move one path into destinationDir under a collision-free name
     *
     * destinationDir is created when missing. A rename across filesystems
     * falls back to copy and remove.
     */
    Outcome moveOne(const std::filesystem::path& source, const std::filesystem::path& destinationDir);

    /**
     * @brief Remove one file, or one directory with everything below it
     */
    Outcome deleteOne(const std::filesystem::path& source);

    /**
     * @brief First free name for source inside dir
     *
     * Files: "x.txt", "x_1.txt", "x_2.txt"... Directories: "x", "x_1", "x_2"...
     */
    std::filesystem::path uniqueDestination(const std::filesystem::path& dir,
                                            const std::filesystem::path& source,
                                            bool isDirectory) const;

private:
    // Present on disk, including dangling symbolic links
    bool present(const std::filesystem::path& p) const;
    bool allowed(const std::filesystem::path& p, std::string& cause) const;

    IFileSystem& m_fs;
    const PathGuard& m_guard;
};

#endif // RELOCATOR_HPP
