/**
 * @file CatalogWalker.hpp
 * @brief Paginated traversal of the tile catalog
 *
 * Lists collections (mosaics) and the tiles (quads) of a collection that
 * intersect a bounding box, following "_links._next" until the catalog
 * stops supplying one. Tile listings are deduplicated against the cache
 * and written back to it before returning.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "quadfetch.hpp"
#include "CatalogCache.hpp"
#include "HttpClient.hpp"
#include "Logger.hpp"
#include <string>
#include <vector>

namespace quadfetch {

class CatalogWalker {
public:
    /**
     * @brief Counters for the most recent list_tiles() call
     */
    struct ListingStats {
        std::size_t cached_records = 0;      // records seeded from the cache
        std::size_t pages_fetched = 0;
        std::size_t items_seen = 0;
        std::size_t new_records = 0;
        std::size_t duplicates_skipped = 0;
        std::size_t unusable_skipped = 0;    // no id or no download link
        bool complete = false;               // false: a page failed, results are partial
        std::string failure_message;
    };

    CatalogWalker(RetryingHttpClient& client, CatalogCache& cache, const FetchConfig& config);

    /**
     * @brief All collections whose name starts with the configured prefix
     *
     * Each id appears once, in first-listed order. Uses the catalog-root
     * retry policy.
     *
     * @throws FetchError when a page cannot be fetched or parsed; the run cannot continue
     */
    std::vector<Collection> list_collections();

    /**
     * @brief Cached plus newly discovered tiles of a collection within bbox
     *
     * Seeds from the cache, appends unseen tiles in page/item order, and
     * writes the result back to the cache. If a page fails after its
     * retries, the tiles gathered so far are persisted and returned.
     *
     * @throws FetchError CACHE_IO if the write-back fails
     */
    std::vector<TileRecord> list_tiles(const std::string& collection_id, const BoundingBox& bbox);

    const ListingStats& last_listing_stats() const { return last_stats_; }

    std::string tiles_url(const std::string& collection_id) const;

private:
    RetryingHttpClient& client_;
    CatalogCache& cache_;
    FetchConfig config_;
    ListingStats last_stats_;
    Logger logger_;
};

} // namespace quadfetch
