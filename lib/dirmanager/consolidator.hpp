#ifndef CONSOLIDATOR_HPP
#define CONSOLIDATOR_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "ifilesystem.hpp"
#include "treewalker.hpp"

/**
 * @brief Merges the distinct contents of text files into one document
 *
 * Files are selected by extension only. Each one is read as UTF-8 text with
 * "\r\n" and "\r" line ends turned into "\n", stripped of leading and
 * trailing whitespace and kept only if that exact text has not been seen
 * before. Two files with the same text contribute once; a file that is
 * empty after stripping contributes nothing. A file that is not valid UTF-8
 * is recorded as a read failure.
 */
class Consolidator {
public:
    struct ReadFailure {
        std::filesystem::path path;
        std::string message;
    };

    struct Result {
        std::vector<std::string> contents; // distinct, in first-seen order
        std::vector<ReadFailure> failures;
        std::size_t filesRead = 0;
    };

    explicit Consolidator(const IFileSystem& fs) : m_fs(fs) {}

    /**
     * @brief Read every file below root whose extension matches
     * @param walker Walker to enumerate with (carries any exclusions)
     * @param root Directory to scan
     * @param extension Extension filter, e.g. ".txt" (case-insensitive)
     */
    Result collect(const TreeWalker& walker,
                   const std::filesystem::path& root,
                   const std::string& extension) const;

    /**
     * @brief Join contents with one blank line between them
     */
    static std::string render(const std::vector<std::string>& contents);

    /**
     * @brief Remove leading and trailing whitespace
     */
    static std::string strip(const std::string& text);

    /**
     * @brief Turn "\r\n" and lone "\r" into "\n"
     */
    static std::string normalizeNewlines(const std::string& text);

    static bool isValidUtf8(const std::string& text);

private:
    const IFileSystem& m_fs;
};

#endif // CONSOLIDATOR_HPP
