/**
 * @file artifactwriter.hpp
 * @brief Non-overwriting persistence of reports and merged files
 */

#ifndef ARTIFACTWRITER_HPP
#define ARTIFACTWRITER_HPP

#include <ctime>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>

#include "ifilesystem.hpp"

/**
 * @class ArtifactWriter
 * @brief Writes output files without ever replacing an earlier one
 *
 * Naming rule, applied per write:
 * 1. The target directory is created if it does not exist
 * 2. The canonical name is used if it is free ("duplicate_report.json")
 * 3. Otherwise a local timestamp is inserted before the extension
 *    ("duplicate_report_20260118093000.json")
 * 4. If that name is taken as well, "_1", "_2", ... follows the timestamp
 *
 * @note The clock is injectable so tests can pin the timestamp
 */
class ArtifactWriter {
public:
  using Clock = std::function<std::time_t()>;

  struct WriteResult {
    bool ok = false;
    std::filesystem::path path;
    std::string error;
  };

  explicit ArtifactWriter(IFileSystem &fs,
                          Clock clock = [] { return std::time(nullptr); })
      : m_fs(fs), m_clock(std::move(clock)) {}

  /**
   * @brief First free path for fileName inside dir, following the rule above
   *
   * Does not create anything on disk.
   */
  std::filesystem::path resolvePath(const std::filesystem::path &dir,
                                    const std::string &fileName) const;

  /**
   * @brief Creates dir if needed and writes content under a free name
   *
   * @return ok and the path written, or the reason the write failed
   */
  WriteResult write(const std::filesystem::path &dir,
                    const std::string &fileName, const std::string &content);

  /**
   * @brief Formats t as local time "YYYYmmddHHMMSS"
   */
  static std::string formatTimestamp(std::time_t t);

private:
  IFileSystem &m_fs;
  Clock m_clock;
};

#endif // ARTIFACTWRITER_HPP
