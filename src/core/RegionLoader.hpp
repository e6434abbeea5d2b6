/**
 * @file RegionLoader.hpp
 * @brief Region-of-interest resolution: GeoJSON envelope or explicit bbox
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "quadfetch.hpp"
#include "Logger.hpp"
#include <optional>
#include <string>

namespace quadfetch {

/**
 * @brief Produces the single BoundingBox a run lists tiles against
 *
 * Vector files are read through GDAL/OGR, so any OGR-readable format works,
 * though GeoJSON is the expected input.
 */
class RegionLoader {
public:
    RegionLoader();

    /**
     * @brief Envelope of every feature geometry in every layer of the file
     * @throws FetchError CONFIGURATION if the file cannot be opened or holds no geometry
     */
    BoundingBox load_bounds(const std::string& path) const;

    /**
     * @brief Explicit bbox from the config when set, else load_bounds(region_file)
     */
    BoundingBox resolve(const FetchConfig& config) const;

    /**
     * @brief Parse "min_x,min_y,max_x,max_y"
     * @return std::nullopt if there are not exactly four numbers or min > max on an axis
     */
    static std::optional<BoundingBox> parse_bbox(const std::string& text);

private:
    Logger logger_;
};

} // namespace quadfetch
