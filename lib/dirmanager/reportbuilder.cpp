#include "reportbuilder.hpp"

#include <system_error>
#include <utility>

using json = nlohmann::ordered_json;

json ReportBuilder::duplicateReport(const std::vector<DuplicateFinder::DuplicateGroup>& groups) {
    json duplicates = json::object();
    for (const auto& group : groups) {
        json paths = json::array();
        for (const auto& path : group.paths) {
            paths.push_back(path.string());
        }
        duplicates[group.name] = std::move(paths);
    }

    json report;
    report["total_duplicates"] = groups.size();
    report["duplicates"] = std::move(duplicates);
    return report;
}

json ReportBuilder::emptyDirectoryReport(const std::vector<std::filesystem::path>& directories) {
    json entries = json::array();
    for (const auto& dir : directories) {
        std::error_code ec;
        auto location = std::filesystem::absolute(dir, ec);
        if (ec) {
            location = dir;
        }
        location = location.lexically_normal();

        // "/data/old/" has an empty filename; report the last real component.
        std::string name = location.filename().string();
        if (name.empty()) {
            name = location.parent_path().filename().string();
        }

        entries.push_back({{"name", name}, {"location", location.string()}});
    }

    json report;
    report["total_empty_directories"] = directories.size();
    report["empty_directories"] = std::move(entries);
    return report;
}

/**
 * @brief Serialises a report as four-space indented, ASCII-only JSON
 *
 * Non-ASCII characters are written as \u escapes. File names are arbitrary
 * byte strings on Linux; bytes that are not valid UTF-8 are replaced with
 * U+FFFD instead of making dump() throw.
 */
std::string ReportBuilder::serialize(const json& report) {
    return report.dump(4, ' ', true, json::error_handler_t::replace);
}
