/**
 * @file RegionLoader.cpp
 * @brief GDAL/OGR backed region loading
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "RegionLoader.hpp"
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <cerrno>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <sstream>
#include <vector>

namespace quadfetch {

namespace {

// RAII wrapper for GDAL dataset
struct GDALDatasetDeleter {
    void operator()(GDALDataset* dataset) {
        if (dataset) {
            GDALClose(dataset);
        }
    }
};

using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

std::once_flag gdal_register_flag;

std::string trim(const std::string& str) {
    const auto first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

} // namespace

RegionLoader::RegionLoader() : logger_("RegionLoader") {
    std::call_once(gdal_register_flag, []() { GDALAllRegister(); });
}

BoundingBox RegionLoader::load_bounds(const std::string& path) const {
    GDALDatasetPtr dataset(static_cast<GDALDataset*>(
        GDALOpenEx(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr)));
    if (!dataset) {
        throw FetchError(ErrorKind::CONFIGURATION, "Cannot open region file " + path + ": " +
                         CPLGetLastErrorMsg());
    }

    OGREnvelope total;
    std::size_t geometry_count = 0;

    for (int i = 0; i < dataset->GetLayerCount(); ++i) {
        OGRLayer* layer = dataset->GetLayer(i);
        if (!layer) {
            continue;
        }
        layer->ResetReading();

        OGRFeatureUniquePtr feature(layer->GetNextFeature());
        while (feature) {
            const OGRGeometry* geometry = feature->GetGeometryRef();
            if (geometry && !geometry->IsEmpty()) {
                OGREnvelope envelope;
                geometry->getEnvelope(&envelope);
                total.Merge(envelope);
                ++geometry_count;
            }
            feature.reset(layer->GetNextFeature());
        }
    }

    if (geometry_count == 0) {
        throw FetchError(ErrorKind::CONFIGURATION, "Region file " + path + " contains no geometry");
    }

    BoundingBox bbox(total.MinX, total.MinY, total.MaxX, total.MaxY);
    logger_.info("Region " + path + ": " + std::to_string(geometry_count) + " geometries, bounds " +
                 bbox.to_query_string());
    return bbox;
}

BoundingBox RegionLoader::resolve(const FetchConfig& config) const {
    if (config.bbox) {
        logger_.detailed("Using configured bounding box " + config.bbox->to_query_string());
        return *config.bbox;
    }
    if (config.region_file.empty()) {
        throw FetchError(ErrorKind::CONFIGURATION, "Neither bbox nor region_file is set");
    }
    return load_bounds(config.region_file);
}

std::optional<BoundingBox> RegionLoader::parse_bbox(const std::string& text) {
    std::vector<double> values;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, ',')) {
        const std::string token = trim(part);
        if (token.empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        errno = 0;
        const double value = std::strtod(token.c_str(), &end);
        if (errno != 0 || end != token.c_str() + token.size()) {
            return std::nullopt;
        }
        values.push_back(value);
    }
    if (values.size() != 4) {
        return std::nullopt;
    }

    BoundingBox bbox(values[0], values[1], values[2], values[3]);
    if (!bbox.is_valid()) {
        return std::nullopt;
    }
    return bbox;
}

} // namespace quadfetch
