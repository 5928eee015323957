/**
 * @file pathguard.cpp
 * @brief Implementation of the safety checks run before moves and deletes
 *
 * This file implements the mechanisms that keep a duplicate sweep from
 * relocating or deleting critical system directories, the user's home
 * directory, or a mounted filesystem.
 */

#include "pathguard.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

/**
 * @brief Critical system paths that must never be moved or deleted
 */
const std::unordered_set<std::string> PathGuard::CRITICAL_PATHS = {
    "/", "/boot", "/dev", "/etc", "/lib", "/lib64",
    "/proc", "/root", "/run", "/sys", "/usr", "/var",
    "/bin", "/sbin", "/opt", "/srv", "/tmp", "/home"
};

PathGuard::PathGuard() : m_mounts(readMountPoints()) {}

PathGuard::PathGuard(std::vector<MountInfo> mounts) : m_mounts(std::move(mounts)) {}

/**
 * @brief Checks whether a path may be moved or deleted
 *
 * The checks run in order of severity:
 * 1. System paths (blocked)
 * 2. User home directory (blocked)
 * 3. Mount points (blocked)
 *
 * @param path The filesystem path to check
 *
 * @return RemovalStatus::Allowed, or the reason the path is blocked
 *
 * @see getStatusMessage()
 */
PathGuard::RemovalStatus PathGuard::checkRemoval(const std::filesystem::path& path) const {
    const std::string normalized = normalize(path);

    if (isSystemPath(normalized)) {
        return RemovalStatus::BlockedSystemPath;
    }

    if (isUserHome(normalized)) {
        return RemovalStatus::BlockedHome;
    }

    if (isMountPoint(normalized)) {
        return RemovalStatus::BlockedMountPoint;
    }

    return RemovalStatus::Allowed;
}

std::string PathGuard::getStatusMessage(RemovalStatus status, const std::string& path) {
    switch (status) {
        case RemovalStatus::Allowed:
            return "Removal allowed";
        case RemovalStatus::BlockedSystemPath:
            return "Refusing to touch system directory: " + path;
        case RemovalStatus::BlockedHome:
            return "Refusing to touch your home directory: " + path;
        case RemovalStatus::BlockedMountPoint:
            return "Refusing to touch mount point: " + path;
        default:
            return "Unknown status";
    }
}

bool PathGuard::isSystemPath(const std::string& path) {
    return CRITICAL_PATHS.count(path) > 0;
}

/**
 * @brief Compares the path with the HOME environment variable
 *
 * @note Returns false if HOME is not set
 */
bool PathGuard::isUserHome(const std::string& path) {
    const char* home = std::getenv("HOME");
    return home && *home && path == normalize(home);
}

bool PathGuard::isMountPoint(const std::string& path) const {
    for (const auto& mount : m_mounts) {
        if (mount.mountpoint == path) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Parses mount table lines
 *
 * Each line holds device, mount point, type, options, dump and pass. The
 * kernel escapes blanks in the first two fields as octal sequences ("\040"),
 * which are decoded here so the mount point compares equal to a real path.
 *
 * @param in Stream positioned at the first line
 *
 * @return One MountInfo per well-formed line
 */
std::vector<PathGuard::MountInfo> PathGuard::parseMounts(std::istream& in) {
    std::vector<MountInfo> mounts;

    std::string line;
    while (std::getline(in, line)) {
        std::istringstream iss(line);
        MountInfo info;

        if (!(iss >> info.device >> info.mountpoint >> info.fstype)) {
            continue;
        }

        info.device = decodeMountField(info.device);
        info.mountpoint = decodeMountField(info.mountpoint);
        mounts.push_back(info);
    }

    return mounts;
}

std::vector<PathGuard::MountInfo> PathGuard::readMountPoints() {
    std::ifstream mounts_file("/proc/mounts");

    if (!mounts_file.is_open()) {
        return {};
    }

    return parseMounts(mounts_file);
}

std::string PathGuard::normalize(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        absolute = path;
    }

    std::string result = absolute.lexically_normal().string();
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

std::string PathGuard::decodeMountField(const std::string& field) {
    std::string decoded;
    decoded.reserve(field.size());

    for (std::size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size()) {
            const std::string digits = field.substr(i + 1, 3);
            bool octal = true;
            for (char c : digits) {
                octal = octal && c >= '0' && c <= '7';
            }
            if (octal) {
                decoded.push_back(static_cast<char>(std::stoi(digits, nullptr, 8)));
                i += 3;
                continue;
            }
        }
        decoded.push_back(field[i]);
    }

    return decoded;
}
