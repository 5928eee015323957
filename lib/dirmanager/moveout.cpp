/**
 * @file moveout.cpp
 * @brief Implementation of the move-out operations
 */

#include "moveout.hpp"
#include "treewalker.hpp"

#include <iterator>

namespace fs = std::filesystem;

namespace {

fs::path normalDir(const fs::path& p) {
    auto normal = p.lexically_normal();
    if (!normal.has_filename() && normal.has_parent_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

} // namespace

MoveOut::MoveOut(IFileSystem& fs, Relocator& relocator)
    : m_fs(fs), m_relocator(relocator) {}

std::optional<fs::path> MoveOut::findDeepestFolder(const fs::path& root,
                                                   const fs::path& reference) const {
    const auto ref = normalDir(reference);

    std::optional<fs::path> deepest;
    int maxDepth = -1;

    auto consider = [&](const fs::path& dir) {
        if (normalDir(dir) == ref || !containsFile(dir)) {
            return;
        }
        const int depth = relativeDepth(dir, ref);
        // Strictly greater: the first directory found at a depth keeps it
        if (depth > maxDepth) {
            maxDepth = depth;
            deepest = dir;
        }
    };

    consider(root);

    TreeWalker walker(m_fs);
    walker.walk(root, [&](const Entry& entry) {
        if (entry.isDirectory() && !m_fs.isSymlink(entry.getPath())) {
            consider(entry.getPath());
        }
    });

    return deepest;
}

std::optional<Outcome> MoveOut::moveOutDeepestFolder(const fs::path& root,
                                                     const fs::path& reference) {
    auto deepest = findDeepestFolder(root, reference);
    if (!deepest) {
        return std::nullopt;
    }
    return m_relocator.moveOne(*deepest, reference);
}

std::vector<Outcome> MoveOut::moveOutFiles(const fs::path& root,
                                           const fs::path& reference) {
    const auto ref = normalDir(reference);

    // Collect first, move afterwards: moving while walking would feed the
    // moved files back into the walk when reference lies inside root.
    std::vector<fs::path> files;
    TreeWalker walker(m_fs);
    walker.walk(root, [&](const Entry& entry) {
        if (entry.isFile() && normalDir(entry.getPath().parent_path()) != ref) {
            files.push_back(entry.getPath());
        }
    });

    return m_relocator.relocate(files, reference, Relocator::Mode::Move);
}

int MoveOut::relativeDepth(const fs::path& path, const fs::path& reference) {
    auto rel = normalDir(path).lexically_relative(normalDir(reference));
    if (rel.empty()) {
        rel = normalDir(path);
    }
    return static_cast<int>(std::distance(rel.begin(), rel.end()));
}

bool MoveOut::containsFile(const fs::path& dir) const {
    std::vector<fs::path> children;
    if (m_fs.listDirectory(dir, children)) {
        return false;
    }
    for (const auto& child : children) {
        if (!m_fs.isDirectory(child)) {
            return true;
        }
    }
    return false;
}
