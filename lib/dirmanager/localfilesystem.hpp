#ifndef LOCALFILESYSTEM_HPP
#define LOCALFILESYSTEM_HPP

#include "ifilesystem.hpp"

/**
 * @brief IFileSystem backed by std::filesystem and std::fstream
 *
 * All std::filesystem calls use the error_code overloads; nothing in this
 * class throws for ordinary I/O failures.
 *
 * @note Implementation is in localfilesystem.cpp
 */
class LocalFileSystem : public IFileSystem {
public:
    bool exists(const std::filesystem::path& p) const override;
    bool isDirectory(const std::filesystem::path& p) const override;
    bool isSymlink(const std::filesystem::path& p) const override;

    std::error_code listDirectory(const std::filesystem::path& dir,
                                  std::vector<std::filesystem::path>& children) const override;

    std::error_code createDirectories(const std::filesystem::path& dir) override;
    std::error_code rename(const std::filesystem::path& from,
                           const std::filesystem::path& to) override;
    std::error_code copyRecursive(const std::filesystem::path& from,
                                  const std::filesystem::path& to) override;
    std::error_code removeFile(const std::filesystem::path& p) override;
    std::error_code removeAll(const std::filesystem::path& p) override;
    std::error_code removeEmptyDirectory(const std::filesystem::path& dir) override;

    std::error_code readText(const std::filesystem::path& file, std::string& content) const override;
    std::error_code writeText(const std::filesystem::path& file, const std::string& content) override;
};

#endif // LOCALFILESYSTEM_HPP
