#ifndef PATHGUARD_HPP
#define PATHGUARD_HPP

#include <filesystem>
#include <istream>
#include <string>
#include <unordered_set>
#include <vector>

/**
 * @brief Safety checks applied before a path is moved or deleted
 */
class PathGuard {
public:
    enum class RemovalStatus {
        Allowed,
        BlockedSystemPath,
        BlockedHome,
        BlockedMountPoint
    };

    struct MountInfo {
        std::string device;
        std::string mountpoint;
        std::string fstype;
    };

    /**
     * @brief Build a guard from the live mount table in /proc/mounts
     */
    PathGuard();

    /**
     * @brief Build a guard from a known mount table
     */
    explicit PathGuard(std::vector<MountInfo> mounts);

    /**
     * @brief Check if removing a path is allowed
     * @param path Path to check; made absolute and normalised first
     * @return RemovalStatus indicating if/why removal is blocked
     */
    RemovalStatus checkRemoval(const std::filesystem::path& path) const;

    /**
     * @brief Get human-readable message for a removal status
     */
    static std::string getStatusMessage(RemovalStatus status, const std::string& path);

    /**
     * @brief Check if path is a critical system directory
     */
    static bool isSystemPath(const std::string& path);

    /**
     * @brief Check if path is the user's home directory
     */
    static bool isUserHome(const std::string& path);

    /**
     * @brief Check if path is a mount point of the loaded table
     */
    bool isMountPoint(const std::string& path) const;

    /**
     * @brief Parse mount table lines in /proc/mounts format
     */
    static std::vector<MountInfo> parseMounts(std::istream& in);

    /**
     * @brief Read all mount points from /proc/mounts
     * @return Empty vector when the table cannot be read
     */
    static std::vector<MountInfo> readMountPoints();

private:
    static std::string normalize(const std::filesystem::path& path);
    static std::string decodeMountField(const std::string& field);

    static const std::unordered_set<std::string> CRITICAL_PATHS;

    std::vector<MountInfo> m_mounts;
};

#endif // PATHGUARD_HPP
