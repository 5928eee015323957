/**
 * @file localfilesystem.cpp
 * @brief std::filesystem implementation of the IFileSystem interface
 */

#include "localfilesystem.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <sstream>

namespace fs = std::filesystem;

namespace {

// Stream failures do not carry an error_code; errno is the best hint left.
std::error_code streamError() {
  if (errno != 0) {
    return std::error_code(errno, std::generic_category());
  }
  return std::make_error_code(std::errc::io_error);
}

} // namespace

bool LocalFileSystem::exists(const fs::path &p) const {
  std::error_code ec;
  return fs::exists(p, ec) && !ec;
}

bool LocalFileSystem::isDirectory(const fs::path &p) const {
  std::error_code ec;
  return fs::is_directory(p, ec) && !ec;
}

bool LocalFileSystem::isSymlink(const fs::path &p) const {
  std::error_code ec;
  return fs::is_symlink(p, ec) && !ec;
}

/**
 * @brief Lists a directory and sorts the children by file name
 *
 * directory_iterator gives no ordering guarantee; sorting here is what makes
 * every walk, and therefore the choice of "original" in a duplicate group,
 * reproducible.
 */
std::error_code
LocalFileSystem::listDirectory(const fs::path &dir,
                               std::vector<fs::path> &children) const {
  children.clear();

  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec)
    return ec;

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec)
      return ec;
    children.push_back(it->path());
  }
  if (ec)
    return ec;

  std::sort(children.begin(), children.end(),
            [](const fs::path &a, const fs::path &b) {
              return a.filename().string() < b.filename().string();
            });
  return {};
}

std::error_code LocalFileSystem::createDirectories(const fs::path &dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  return ec;
}

std::error_code LocalFileSystem::rename(const fs::path &from,
                                        const fs::path &to) {
  std::error_code ec;
  fs::rename(from, to, ec);
  return ec;
}

std::error_code LocalFileSystem::copyRecursive(const fs::path &from,
                                               const fs::path &to) {
  std::error_code ec;
  fs::copy(from, to,
           fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
  return ec;
}

std::error_code LocalFileSystem::removeFile(const fs::path &p) {
  std::error_code ec;
  if (!fs::remove(p, ec) && !ec) {
    return std::make_error_code(std::errc::no_such_file_or_directory);
  }
  return ec;
}

std::error_code LocalFileSystem::removeAll(const fs::path &p) {
  std::error_code ec;
  fs::remove_all(p, ec);
  return ec;
}

std::error_code LocalFileSystem::removeEmptyDirectory(const fs::path &dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return ec ? ec : std::make_error_code(std::errc::not_a_directory);
  }

  // remove() on a directory maps to rmdir(2), which refuses non-empty ones.
  if (!fs::remove(dir, ec) && !ec) {
    return std::make_error_code(std::errc::no_such_file_or_directory);
  }
  return ec;
}

std::error_code LocalFileSystem::readText(const fs::path &file,
                                          std::string &content) const {
  errno = 0;
  std::ifstream in(file, std::ios::binary);
  if (!in)
    return streamError();

  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad())
    return streamError();

  content = ss.str();
  return {};
}

std::error_code LocalFileSystem::writeText(const fs::path &file,
                                           const std::string &content) {
  errno = 0;
  std::ofstream out(file, std::ios::binary | std::ios::trunc);
  if (!out)
    return streamError();

  out << content;
  out.flush();
  if (!out)
    return streamError();
  return {};
}
