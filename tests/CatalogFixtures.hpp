/**
 * @file CatalogFixtures.hpp
 * @brief JSON builders for scripted catalog responses
 */

#pragma once

#include "quadfetch.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace quadfetch::test {

using json = nlohmann::json;

inline const std::string kCatalogBase = "https://catalog.test/basemaps/v1/mosaics";

inline FetchConfig catalog_config() {
    FetchConfig config;
    config.api_base_url = kCatalogBase;
    config.api_key = "test-key";
    config.collection_prefix = "nicfi";
    config.bbox = BoundingBox(-10.0, 4.0, -9.0, 5.0);
    return config;
}

inline json mosaic(const std::string& id, const std::string& name,
                   const std::string& first_acquired = "2020-01-01T00:00:00.000Z") {
    return json{{"id", id}, {"name", name}, {"first_acquired", first_acquired}};
}

inline std::string mosaics_page(const std::vector<json>& mosaics, const std::string& next = "") {
    json page{{"mosaics", mosaics}};
    if (!next.empty()) {
        page["_links"] = json{{"_next", next}};
    }
    return page.dump();
}

inline std::string download_url_for(const std::string& collection_id, const std::string& tile_id) {
    return "https://tiles.test/" + collection_id + "/" + tile_id + "/full";
}

inline json quad(const std::string& collection_id, const std::string& tile_id, double coverage = 100.0) {
    return json{
        {"id", tile_id},
        {"bbox", {-10.0, 4.0, -9.5, 4.5}},
        {"percent_covered", coverage},
        {"_links", {{"download", download_url_for(collection_id, tile_id)}}}
    };
}

inline std::string items_page(const std::vector<json>& items, const std::string& next = "") {
    json page{{"items", items}};
    if (!next.empty()) {
        page["_links"] = json{{"_next", next}};
    }
    return page.dump();
}

inline std::string quads_url(const std::string& collection_id) {
    return kCatalogBase + "/" + collection_id + "/quads";
}

} // namespace quadfetch::test
