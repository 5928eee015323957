/**
 * @file reportbuilder.hpp
 * @brief JSON documents written by the report command
 */

#ifndef REPORTBUILDER_HPP
#define REPORTBUILDER_HPP

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "duplicatefinder.hpp"

/**
 * @class ReportBuilder
 * @brief Shapes and serialises the duplicate and empty-directory reports
 *
 * Keys keep insertion order, so duplicate groups appear in the order they
 * were discovered.
 *
 * @see ArtifactWriter
 */
class ReportBuilder {
public:
    static constexpr const char* kDuplicateReportName = "duplicate_report.json";
    static constexpr const char* kEmptyDirectoryReportName = "empty-directories.json";

    /**
     * @brief {"total_duplicates": N, "duplicates": {name: [paths...]}}
     */
    static nlohmann::ordered_json duplicateReport(const std::vector<DuplicateFinder::DuplicateGroup>& groups);

    /**
     * @brief {"total_empty_directories": N, "empty_directories": [{"name", "location"}...]}
     *
     * Locations are made absolute.
     */
    static nlohmann::ordered_json emptyDirectoryReport(const std::vector<std::filesystem::path>& directories);

    /**
     * @brief Text as stored on disk: four-space indent, ASCII only
     *
     * Never throws for names that are not valid UTF-8.
     */
    static std::string serialize(const nlohmann::ordered_json& report);
};

#endif // REPORTBUILDER_HPP
