/**
 * @file FetchOrchestrator.cpp
 * @brief Implementation of run orchestration
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "FetchOrchestrator.hpp"
#include <chrono>
#include <utility>
#include <vector>

namespace quadfetch {

FetchOrchestrator::FetchOrchestrator(const FetchConfig& config, HttpTransport& transport,
                                     RetryingHttpClient::Sleeper sleeper)
    : config_(config)
    , client_(transport, config.api_key, std::move(sleeper))
    , cache_(config.resolved_cache_file())
    , walker_(client_, cache_, config_)
    , downloader_(client_, config.download_timeout_seconds)
    , logger_("FetchOrchestrator")
{
}

std::filesystem::path FetchOrchestrator::collection_directory(const Collection& collection) const {
    const std::string& folder = collection.name.empty() ? collection.id : collection.name;
    return std::filesystem::path(config_.output_directory) / TileDownloader::encode_path_component(folder);
}

bool FetchOrchestrator::run(const BoundingBox& bbox) {
    if (!bbox.is_valid()) {
        throw FetchError(ErrorKind::CONFIGURATION, "Invalid bounding box " + bbox.to_query_string());
    }
    auto start_time = std::chrono::steady_clock::now();

    logger_.info("Fetching tiles within " + bbox.to_query_string() + " into " +
                 config_.output_directory);
    cache_.load();

    std::vector<Collection> collections;
    try {
        collections = walker_.list_collections();
    } catch (const FetchError& e) {
        logger_.error(std::string("Could not list collections: ") + e.what());
        return false;
    }

    if (config_.max_collections > 0 &&
        collections.size() > static_cast<size_t>(config_.max_collections)) {
        logger_.info("Limiting run to the first " + std::to_string(config_.max_collections) +
                     " of " + std::to_string(collections.size()) + " collections");
        collections.resize(static_cast<size_t>(config_.max_collections));
    }

    for (const auto& collection : collections) {
        process_collection(collection, bbox);
    }

    tracker_.logSummary();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    logger_.info("Run finished in " + RunTracker::formatDuration(elapsed));
    return true;
}

void FetchOrchestrator::process_collection(const Collection& collection, const BoundingBox& bbox) {
    tracker_.startCollection(collection);

    std::vector<TileRecord> records;
    try {
        records = walker_.list_tiles(collection.id, bbox);
    } catch (const FetchError& e) {
        // Only a failed cache write-back escapes list_tiles
        logger_.error("Tile listing for collection " + collection.name + " failed: " + e.what());
        tracker_.recordListingFailure(collection.id, e.what());
        tracker_.completeCollection(collection.id);
        return;
    }

    const auto& stats = walker_.last_listing_stats();
    tracker_.recordListing(collection.id, records.size(), stats.new_records, stats.complete,
                           stats.failure_message);

    if (!records.empty()) {
        auto outcomes = downloader_.download_all(records, collection_directory(collection),
                                                 config_.concurrency);
        tracker_.recordOutcomes(collection.id, outcomes);
    }

    tracker_.completeCollection(collection.id);
}

} // namespace quadfetch
