/**
 * @file FetchOrchestrator.hpp
 * @brief Sequences a full run: collections, tile listings, downloads
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "quadfetch.hpp"
#include "../core/CatalogCache.hpp"
#include "../core/CatalogWalker.hpp"
#include "../core/HttpClient.hpp"
#include "../core/Logger.hpp"
#include "../core/RunTracker.hpp"
#include "../core/TileDownloader.hpp"
#include <filesystem>

namespace quadfetch {

/**
 * @brief Drives one run over every matching collection
 *
 * Responsibilities:
 * - Load the tile cache once before any listing
 * - List matching collections (a failure here ends the run)
 * - Per collection: list tiles, then download them into a folder named
 *   after the collection
 * - Keep going past per-collection, per-page and per-tile failures
 *
 * Collections are processed one after another; downloads within a
 * collection run concurrently.
 */
class FetchOrchestrator {
public:
    /**
     * @param config Run configuration (copied)
     * @param transport Transport for every request (not owned)
     * @param sleeper Retry backoff sleep; empty means real sleeping
     */
    FetchOrchestrator(const FetchConfig& config, HttpTransport& transport,
                      RetryingHttpClient::Sleeper sleeper = {});

    /**
     * @brief Execute the run for a region
     * @return false only when the collection listing itself failed
     * @throws FetchError CONFIGURATION for an invalid bounding box
     */
    bool run(const BoundingBox& bbox);

    const RunTracker& get_tracker() const { return tracker_; }

    /**
     * @brief Folder for a collection's tiles under the output directory
     */
    std::filesystem::path collection_directory(const Collection& collection) const;

private:
    FetchConfig config_;
    RetryingHttpClient client_;
    CatalogCache cache_;
    CatalogWalker walker_;
    TileDownloader downloader_;
    RunTracker tracker_;
    Logger logger_;

    void process_collection(const Collection& collection, const BoundingBox& bbox);

    // Disable copy/move since members hold references to each other
    FetchOrchestrator(const FetchOrchestrator&) = delete;
    FetchOrchestrator& operator=(const FetchOrchestrator&) = delete;
    FetchOrchestrator(FetchOrchestrator&&) = delete;
    FetchOrchestrator& operator=(FetchOrchestrator&&) = delete;
};

} // namespace quadfetch
