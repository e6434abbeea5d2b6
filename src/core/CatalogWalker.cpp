/**
 * @file CatalogWalker.cpp
 * @brief Implementation of paginated catalog traversal
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "CatalogWalker.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <unordered_set>

using json = nlohmann::json;

namespace quadfetch {

namespace {

std::optional<std::string> next_link(const json& page) {
    const auto links = page.find("_links");
    if (links == page.end() || !links->is_object()) {
        return std::nullopt;
    }
    const auto next = links->find("_next");
    if (next == links->end() || !next->is_string()) {
        return std::nullopt;
    }
    std::string url = next->get<std::string>();
    if (url.empty()) {
        return std::nullopt;
    }
    return url;
}

std::string string_field(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

std::string download_link(const json& item) {
    const auto links = item.find("_links");
    if (links == item.end() || !links->is_object()) {
        return "";
    }
    return string_field(*links, "download");
}

BoundingBox item_bbox(const json& item) {
    const auto bbox = item.find("bbox");
    if (bbox == item.end() || !bbox->is_array() || bbox->size() != 4) {
        return BoundingBox();
    }
    for (const auto& value : *bbox) {
        if (!value.is_number()) {
            return BoundingBox();
        }
    }
    return BoundingBox((*bbox)[0].get<double>(), (*bbox)[1].get<double>(),
                       (*bbox)[2].get<double>(), (*bbox)[3].get<double>());
}

const json* item_array(const json& page) {
    for (const char* key : {"items", "quads"}) {
        const auto it = page.find(key);
        if (it != page.end() && it->is_array()) {
            return &*it;
        }
    }
    return nullptr;
}

} // namespace

CatalogWalker::CatalogWalker(RetryingHttpClient& client, CatalogCache& cache, const FetchConfig& config)
    : client_(client), cache_(cache), config_(config), logger_("CatalogWalker") {
}

std::string CatalogWalker::tiles_url(const std::string& collection_id) const {
    std::string base = config_.api_base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/" + collection_id + "/quads";
}

std::vector<Collection> CatalogWalker::list_collections() {
    std::vector<Collection> collections;
    std::unordered_set<std::string> visited;
    std::unordered_set<std::string> seen_ids;

    std::string url = config_.api_base_url;
    std::size_t page_count = 0;
    std::size_t listed = 0;

    while (true) {
        visited.insert(url);

        const HttpResponse response =
            client_.get(url, {}, config_.request_timeout_seconds, config_.catalog_retry);

        json page;
        try {
            page = json::parse(response.body);
        } catch (const json::exception& e) {
            throw FetchError(ErrorKind::PERMANENT_REQUEST,
                             "Malformed collection listing from " + url + ": " + e.what());
        }
        ++page_count;

        const auto mosaics = page.find("mosaics");
        if (mosaics != page.end() && mosaics->is_array()) {
            for (const auto& mosaic : *mosaics) {
                ++listed;
                Collection collection;
                collection.id = string_field(mosaic, "id");
                collection.name = string_field(mosaic, "name");
                collection.temporal_label = string_field(mosaic, "first_acquired");

                if (collection.id.empty()) {
                    logger_.warning("Skipping collection without id on page " +
                                    std::to_string(page_count));
                    continue;
                }
                if (collection.name.rfind(config_.collection_prefix, 0) != 0) {
                    logger_.trace("Ignoring collection " + collection.name);
                    continue;
                }
                if (!seen_ids.insert(collection.id).second) {
                    logger_.debug("Skipping repeated collection " + collection.id);
                    continue;
                }
                collections.push_back(std::move(collection));
            }
        }

        const auto next = next_link(page);
        if (!next) {
            break;
        }
        if (visited.count(*next) > 0) {
            logger_.warning("Collection listing links back to " + *next + "; stopping");
            break;
        }
        url = *next;
    }

    logger_.info("Found " + std::to_string(collections.size()) + " collections matching '" +
                 config_.collection_prefix + "' (" + std::to_string(listed) + " listed across " +
                 std::to_string(page_count) + " pages)");
    return collections;
}

std::vector<TileRecord> CatalogWalker::list_tiles(const std::string& collection_id,
                                                  const BoundingBox& bbox) {
    last_stats_ = ListingStats{};
    ListingStats& stats = last_stats_;

    std::vector<TileRecord> records = cache_.get(collection_id);
    std::unordered_set<std::string> seen;
    for (const auto& record : records) {
        seen.insert(record.key());
    }
    stats.cached_records = records.size();

    std::string url = tiles_url(collection_id);
    QueryParams query{
        {"bbox", bbox.to_query_string()},
        {"_page_size", std::to_string(config_.page_size)}
    };
    std::unordered_set<std::string> visited;

    logger_.detailed("Listing tiles for " + collection_id + " within " + bbox.to_query_string() +
                     " (" + std::to_string(stats.cached_records) + " cached)");

    while (true) {
        visited.insert(url);

        json page;
        try {
            const HttpResponse response =
                client_.get(url, query, config_.request_timeout_seconds, config_.page_retry);
            page = json::parse(response.body);
        } catch (const FetchError& e) {
            stats.failure_message = e.what();
        } catch (const json::exception& e) {
            stats.failure_message = "Malformed page from " + url + ": " + e.what();
        }

        if (!stats.failure_message.empty()) {
            logger_.error("Tile listing for collection " + collection_id + " stopped at page " +
                          std::to_string(stats.pages_fetched + 1) + " (" + url + "): " +
                          stats.failure_message + "; keeping " + std::to_string(records.size()) +
                          " tiles gathered so far");
            break;
        }
        ++stats.pages_fetched;

        if (const json* items = item_array(page)) {
            for (const auto& item : *items) {
                ++stats.items_seen;
                if (!item.is_object()) {
                    ++stats.unusable_skipped;
                    continue;
                }

                const std::string tile_id = string_field(item, "id");
                const std::string download_url = download_link(item);
                if (tile_id.empty() || download_url.empty()) {
                    ++stats.unusable_skipped;
                    logger_.debug("Skipping quad '" + tile_id + "' in " + collection_id +
                                  ": no download link");
                    continue;
                }

                const std::string key = TileRecord::make_key(collection_id, tile_id);
                if (!seen.insert(key).second) {
                    ++stats.duplicates_skipped;
                    continue;
                }

                TileRecord record;
                record.collection_id = collection_id;
                record.tile_id = tile_id;
                record.bbox = item_bbox(item);
                const auto coverage = item.find("percent_covered");
                if (coverage != item.end() && coverage->is_number()) {
                    record.percent_covered = coverage->get<double>();
                }
                record.download_url = download_url;
                records.push_back(std::move(record));
                ++stats.new_records;
            }
        } else {
            logger_.warning("Page " + std::to_string(stats.pages_fetched) + " of " +
                            collection_id + " has no item array");
        }

        const auto next = next_link(page);
        if (!next) {
            stats.complete = true;
            break;
        }
        if (visited.count(*next) > 0) {
            logger_.warning("Tile listing for " + collection_id + " links back to " + *next +
                            "; stopping");
            stats.complete = true;
            break;
        }
        // The next-link already carries every parameter
        url = *next;
        query.clear();
    }

    cache_.put(collection_id, records);
    cache_.flush();

    logger_.detailed("Collection " + collection_id + ": " + std::to_string(stats.pages_fetched) +
                     " pages, " + std::to_string(stats.items_seen) + " items, " +
                     std::to_string(stats.new_records) + " new, " +
                     std::to_string(stats.duplicates_skipped) + " duplicates, " +
                     std::to_string(stats.unusable_skipped) + " unusable");
    return records;
}

} // namespace quadfetch
