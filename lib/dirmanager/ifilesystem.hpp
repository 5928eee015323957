#ifndef IFILESYSTEM_HPP
#define IFILESYSTEM_HPP

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

/**
 * @brief Narrow view of the filesystem used by every dirmanager component
 *
 * The walker, relocator, scanners and writers never call std::filesystem
 * directly; they go through this interface so that tests can substitute a
 * filesystem that fails on demand.
 *
 * Query methods never throw and answer false on error. Mutating and reading
 * methods report failure through the returned std::error_code (an empty
 * error_code means success).
 *
 * @see LocalFileSystem
 */
class IFileSystem {
public:
    virtual bool exists(const std::filesystem::path& p) const = 0;
    virtual bool isDirectory(const std::filesystem::path& p) const = 0;
    virtual bool isSymlink(const std::filesystem::path& p) const = 0;

    /**
     * @brief List the direct children of a directory, sorted by file name
     */
    virtual std::error_code listDirectory(const std::filesystem::path& dir,
                                          std::vector<std::filesystem::path>& children) const = 0;

    virtual std::error_code createDirectories(const std::filesystem::path& dir) = 0;
    virtual std::error_code rename(const std::filesystem::path& from,
                                   const std::filesystem::path& to) = 0;
    virtual std::error_code copyRecursive(const std::filesystem::path& from,
                                          const std::filesystem::path& to) = 0;
    virtual std::error_code removeFile(const std::filesystem::path& p) = 0;
    virtual std::error_code removeAll(const std::filesystem::path& p) = 0;

    /**
     * @brief Remove a directory only if it has no entries
     */
    virtual std::error_code removeEmptyDirectory(const std::filesystem::path& dir) = 0;

    virtual std::error_code readText(const std::filesystem::path& file, std::string& content) const = 0;
    virtual std::error_code writeText(const std::filesystem::path& file, const std::string& content) = 0;

    virtual ~IFileSystem() = default;
};

#endif // IFILESYSTEM_HPP
