/**
 * @file artifactwriter.cpp
 * @brief Implementation of the report naming rule
 */

#include "artifactwriter.hpp"

#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

fs::path ArtifactWriter::resolvePath(const fs::path &dir,
                                     const std::string &fileName) const {
  fs::path candidate = dir / fileName;
  if (!m_fs.exists(candidate))
    return candidate;

  const fs::path name(fileName);
  const std::string stem =
      name.stem().string() + "_" + formatTimestamp(m_clock());
  const std::string ext = name.extension().string();

  candidate = dir / (stem + ext);
  for (std::size_t attempt = 1; m_fs.exists(candidate); ++attempt) {
    candidate = dir / (stem + "_" + std::to_string(attempt) + ext);
  }
  return candidate;
}

ArtifactWriter::WriteResult ArtifactWriter::write(const fs::path &dir,
                                                  const std::string &fileName,
                                                  const std::string &content) {
  WriteResult result;

  if (auto ec = m_fs.createDirectories(dir)) {
    result.error =
        "cannot create directory `" + dir.string() + "`: " + ec.message();
    return result;
  }

  result.path = resolvePath(dir, fileName);
  if (auto ec = m_fs.writeText(result.path, content)) {
    result.error =
        "cannot write `" + result.path.string() + "`: " + ec.message();
    return result;
  }

  result.ok = true;
  return result;
}

std::string ArtifactWriter::formatTimestamp(std::time_t t) {
  std::tm local{};
  localtime_r(&t, &local);

  std::ostringstream ss;
  ss << std::put_time(&local, "%Y%m%d%H%M%S");
  return ss.str();
}
