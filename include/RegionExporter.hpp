#ifndef REGION_EXPORTER_HPP
#define REGION_EXPORTER_HPP

#include "RegionTypes.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace regions {

/**
 * @brief Build the export document
 *
 * One member per region, in map order:
 * `"exp:1": {"type": "exp", "ordinal": 1, "page": 0, "rect": [x0,y0,x1,y1]}`
 */
nlohmann::ordered_json regionsToJson(const RegionMap &regions);

/// regionsToJson() dumped with the given indent.
std::string serializeRegions(const RegionMap &regions, int indent = 2);

/**
 * @brief Write the export document to @p path
 *
 * The JSON is written to a temporary file in the same directory and renamed
 * over @p path, so a failure never leaves a partial file behind.
 *
 * @throws std::runtime_error if the file cannot be written
 */
void writeRegionsJson(const RegionMap &regions,
                      const std::filesystem::path &path);

/**
 * @brief Parse an export document back into regions
 *
 * Region text is not part of the export and comes back empty.
 *
 * @throws std::runtime_error on malformed input
 */
RegionMap regionsFromJson(const nlohmann::json &j);

/**
 * @brief Read and parse an export file
 * @throws std::runtime_error if the file cannot be read or is malformed
 */
RegionMap readRegionsJson(const std::filesystem::path &path);

/// "<pdf path>.regions.json"
std::filesystem::path defaultExportPath(const std::filesystem::path &pdfPath);

} // namespace regions

#endif // REGION_EXPORTER_HPP
