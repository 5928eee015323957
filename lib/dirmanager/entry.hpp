#ifndef ENTRY_HPP
#define ENTRY_HPP

#include <cctype>
#include <filesystem>
#include <string>

/**
 * @brief One filesystem object discovered during a tree walk
 *
 * Entries are created by TreeWalker and never modified afterwards. The depth
 * is counted from the scan root: the root itself is depth 0 and is never
 * reported, so the first entry seen always has depth 1.
 *
 * @see TreeWalker
 */
class Entry {
public:
  enum class Kind { File, Directory };

private:
  std::filesystem::path m_path;
  std::string m_name;
  Kind m_kind;
  int m_depth;

public:
  Entry(const std::filesystem::path &p, Kind kind, int depth)
      : m_path(p), m_name(p.filename().string()), m_kind(kind),
        m_depth(depth) {}

  const std::filesystem::path &getPath() const { return m_path; }
  const std::string &getName() const { return m_name; }
  Kind getKind() const { return m_kind; }
  int getDepth() const { return m_depth; }

  bool isDirectory() const { return m_kind == Kind::Directory; }
  bool isFile() const { return m_kind == Kind::File; }

  /**
   * @brief Lower-cased extension including the dot, empty for directories
   *
   * "Photo.JPG" yields ".jpg"; "archive" and any directory yield "".
   */
  std::string getExtension() const {
    if (isDirectory())
      return "";

    std::string ext = m_path.extension().string();
    for (auto &c : ext) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
  }
};

#endif // ENTRY_HPP
