#include "relocator.hpp"

#include <string>
#include <system_error>

Relocator::Relocator(IFileSystem& fs, const PathGuard& guard)
    : m_fs(fs), m_guard(guard) {}

std::vector<Outcome> Relocator::relocate(const std::vector<std::filesystem::path>& paths,
                                         const std::filesystem::path& destination,
                                         Mode mode) {
    std::vector<Outcome> outcomes;
    outcomes.reserve(paths.size());

    for (const auto& path : paths) {
        if (mode == Mode::Move) {
            outcomes.push_back(moveOne(path, destination));
        } else {
            outcomes.push_back(deleteOne(path));
        }
    }

    return outcomes;
}

Outcome Relocator::moveOne(const std::filesystem::path& source, const std::filesystem::path& destinationDir) {
    // Re-checked here: the tree may have changed since the index was built.
    if (!present(source)) {
        return Outcome::missing(source, Outcome::Action::Move);
    }

    const bool isDir = m_fs.isDirectory(source) && !m_fs.isSymlink(source);

    std::string cause;
    if (!allowed(source, cause)) {
        return Outcome::failed(source, Outcome::Action::Move, cause, isDir);
    }

    if (!m_fs.isDirectory(destinationDir)) {
        if (auto ec = m_fs.createDirectories(destinationDir)) {
            return Outcome::failed(source, Outcome::Action::Move,
                                   "cannot create destination `" + destinationDir.string() + "`: " + ec.message(),
                                   isDir);
        }
    }

    const auto targetPath = uniqueDestination(destinationDir, source, isDir);

    std::error_code renameErr = m_fs.rename(source, targetPath);
    if (!renameErr) {
        return Outcome::moved(source, targetPath, isDir);
    }

    if (renameErr == std::errc::cross_device_link) {
        if (auto copyErr = m_fs.copyRecursive(source, targetPath)) {
            std::string why = "cross-device copy failed: " + copyErr.message();
            // Leave no half-copied target behind.
            if (auto cleanupErr = m_fs.removeAll(targetPath)) {
                why += " (partial copy left at `" + targetPath.string() + "`: " + cleanupErr.message() + ")";
            }
            return Outcome::failed(source, Outcome::Action::Move, why, isDir);
        }

        if (auto removeErr = m_fs.removeAll(source)) {
            return Outcome::failed(source, Outcome::Action::Move,
                                   "copied to `" + targetPath.string() +
                                       "` but could not remove the original: " + removeErr.message(),
                                   isDir);
        }
        return Outcome::moved(source, targetPath, isDir);
    }

    return Outcome::failed(source, Outcome::Action::Move, renameErr.message(), isDir);
}

Outcome Relocator::deleteOne(const std::filesystem::path& source) {
    if (!present(source)) {
        return Outcome::missing(source, Outcome::Action::Delete);
    }

    const bool isDir = m_fs.isDirectory(source) && !m_fs.isSymlink(source);

    std::string cause;
    if (!allowed(source, cause)) {
        return Outcome::failed(source, Outcome::Action::Delete, cause, isDir);
    }

    std::error_code ec = isDir ? m_fs.removeAll(source) : m_fs.removeFile(source);
    if (ec) {
        return Outcome::failed(source, Outcome::Action::Delete, ec.message(), isDir);
    }
    return Outcome::deleted(source, isDir);
}

std::filesystem::path Relocator::uniqueDestination(const std::filesystem::path& dir,
                                                   const std::filesystem::path& source,
                                                   bool isDirectory) const {
    const auto fileName = source.filename();
    auto candidate = dir / fileName;
    if (!present(candidate)) {
        return candidate;
    }

    // Directories keep their full name; files keep their extension last.
    const std::string base = isDirectory ? fileName.string() : fileName.stem().string();
    const std::string ext = isDirectory ? std::string{} : fileName.extension().string();

    for (std::size_t attempt = 1;; ++attempt) {
        candidate = dir / (base + "_" + std::to_string(attempt) + ext);
        if (!present(candidate)) {
            return candidate;
        }
    }
}

bool Relocator::present(const std::filesystem::path& p) const {
    return m_fs.exists(p) || m_fs.isSymlink(p);
}

bool Relocator::allowed(const std::filesystem::path& p, std::string& cause) const {
    const auto status = m_guard.checkRemoval(p);
    if (status == PathGuard::RemovalStatus::Allowed) {
        return true;
    }
    cause = PathGuard::getStatusMessage(status, p.string());
    return false;
}
