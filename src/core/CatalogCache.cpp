/**
 * @file CatalogCache.cpp
 * @brief Implementation of the durable tile-record store
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "CatalogCache.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <unordered_set>

using json = nlohmann::json;

namespace quadfetch {

namespace {

json record_to_json(const TileRecord& record) {
    return json{
        {"mosaic_id", record.collection_id},
        {"quad_id", record.tile_id},
        {"bbox", {record.bbox.min_x, record.bbox.min_y, record.bbox.max_x, record.bbox.max_y}},
        {"percent_covered", record.percent_covered},
        {"download_url", record.download_url}
    };
}

TileRecord record_from_json(const json& j, const std::string& collection_id) {
    TileRecord record;
    // The owning key is authoritative for the dedup invariant
    record.collection_id = collection_id;
    record.tile_id = j.at("quad_id").get<std::string>();
    record.download_url = j.at("download_url").get<std::string>();
    record.percent_covered = j.value("percent_covered", 0.0);

    const auto bbox_it = j.find("bbox");
    if (bbox_it != j.end() && bbox_it->is_array() && bbox_it->size() == 4) {
        record.bbox = BoundingBox((*bbox_it)[0].get<double>(), (*bbox_it)[1].get<double>(),
                                  (*bbox_it)[2].get<double>(), (*bbox_it)[3].get<double>());
    }
    return record;
}

} // namespace

CatalogCache::CatalogCache(std::filesystem::path store_path)
    : store_path_(std::move(store_path)), logger_("CatalogCache") {
}

std::filesystem::path CatalogCache::temp_path() const {
    auto path = store_path_;
    path += ".tmp";
    return path;
}

std::size_t CatalogCache::load() {
    std::map<std::string, std::vector<TileRecord>> loaded;

    std::error_code ec;
    if (std::filesystem::exists(temp_path(), ec)) {
        logger_.warning("Discarding incomplete cache write: " + temp_path().string());
        std::filesystem::remove(temp_path(), ec);
    }

    if (!std::filesystem::exists(store_path_, ec)) {
        logger_.info("No cache at " + store_path_.string() + "; starting empty");
        std::lock_guard<std::mutex> lock(store_mutex_);
        store_.clear();
        return 0;
    }

    try {
        std::ifstream file(store_path_, std::ios::binary);
        if (!file.is_open()) {
            throw FetchError(ErrorKind::CACHE_IO, "Cannot open " + store_path_.string());
        }

        const json root = json::parse(file);
        if (!root.is_object()) {
            throw FetchError(ErrorKind::CACHE_IO, "Top-level value is not an object");
        }

        std::size_t skipped = 0;
        for (const auto& [collection_id, entries] : root.items()) {
            if (!entries.is_array()) {
                throw FetchError(ErrorKind::CACHE_IO,
                                 "Entry for collection " + collection_id + " is not an array");
            }

            auto& records = loaded[collection_id];
            std::unordered_set<std::string> seen;
            for (const auto& entry : entries) {
                try {
                    TileRecord record = record_from_json(entry, collection_id);
                    if (seen.insert(record.key()).second) {
                        records.push_back(std::move(record));
                    } else {
                        ++skipped;
                    }
                } catch (const json::exception& e) {
                    logger_.warning("Skipping malformed cached record in " + collection_id +
                                    ": " + e.what());
                    ++skipped;
                }
            }
        }

        if (skipped > 0) {
            logger_.warning("Dropped " + std::to_string(skipped) +
                            " duplicate or malformed cached records");
        }
    } catch (const json::exception& e) {
        quarantine_corrupt_file(e.what());
        loaded.clear();
    } catch (const FetchError& e) {
        quarantine_corrupt_file(e.what());
        loaded.clear();
    }

    std::lock_guard<std::mutex> lock(store_mutex_);
    store_ = std::move(loaded);

    std::size_t total_records = 0;
    for (const auto& [id, records] : store_) {
        total_records += records.size();
    }
    logger_.info("Loaded cache " + store_path_.string() + ": " + std::to_string(store_.size()) +
                 " collections, " + std::to_string(total_records) + " tiles");
    return store_.size();
}

void CatalogCache::quarantine_corrupt_file(const std::string& reason) {
    auto corrupt_path = store_path_;
    corrupt_path += ".corrupt";

    logger_.error("CACHE FILE IS CORRUPT: " + store_path_.string() + " (" + reason +
                  "). Starting with an empty cache; previously listed tiles will be re-listed.");

    std::error_code ec;
    std::filesystem::rename(store_path_, corrupt_path, ec);
    if (ec) {
        logger_.warning("Could not move corrupt cache aside: " + ec.message());
    } else {
        logger_.warning("Corrupt cache preserved as " + corrupt_path.string());
    }
}

std::vector<TileRecord> CatalogCache::get(const std::string& collection_id) const {
    std::lock_guard<std::mutex> lock(store_mutex_);
    auto it = store_.find(collection_id);
    if (it == store_.end()) {
        return {};
    }
    return it->second;
}

void CatalogCache::put(const std::string& collection_id, std::vector<TileRecord> records) {
    std::lock_guard<std::mutex> lock(store_mutex_);
    store_[collection_id] = std::move(records);
}

bool CatalogCache::contains(const std::string& collection_id) const {
    std::lock_guard<std::mutex> lock(store_mutex_);
    return store_.find(collection_id) != store_.end();
}

std::size_t CatalogCache::collection_count() const {
    std::lock_guard<std::mutex> lock(store_mutex_);
    return store_.size();
}

std::size_t CatalogCache::record_count() const {
    std::lock_guard<std::mutex> lock(store_mutex_);
    std::size_t total = 0;
    for (const auto& [id, records] : store_) {
        total += records.size();
    }
    return total;
}

void CatalogCache::flush() {
    std::lock_guard<std::mutex> flush_lock(flush_mutex_);

    std::string payload;
    {
        std::lock_guard<std::mutex> lock(store_mutex_);
        json root = json::object();
        for (const auto& [collection_id, records] : store_) {
            json entries = json::array();
            for (const auto& record : records) {
                entries.push_back(record_to_json(record));
            }
            root[collection_id] = std::move(entries);
        }
        payload = root.dump(2);
    }

    std::error_code ec;
    if (store_path_.has_parent_path()) {
        std::filesystem::create_directories(store_path_.parent_path(), ec);
        if (ec) {
            throw FetchError(ErrorKind::CACHE_IO, "Cannot create cache directory " +
                             store_path_.parent_path().string() + ": " + ec.message());
        }
    }

    const auto tmp = temp_path();
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw FetchError(ErrorKind::CACHE_IO, "Cannot open " + tmp.string() + " for writing");
        }
        file << payload;
        file.flush();
        if (!file.good()) {
            file.close();
            std::filesystem::remove(tmp, ec);
            throw FetchError(ErrorKind::CACHE_IO, "Short write to " + tmp.string());
        }
    }

    std::filesystem::rename(tmp, store_path_, ec);
    if (ec) {
        std::error_code remove_ec;
        std::filesystem::remove(tmp, remove_ec);
        throw FetchError(ErrorKind::CACHE_IO, "Cannot replace " + store_path_.string() + ": " +
                         ec.message());
    }

    logger_.debug("Flushed cache to " + store_path_.string() + " (" +
                  std::to_string(payload.size()) + " bytes)");
}

} // namespace quadfetch
