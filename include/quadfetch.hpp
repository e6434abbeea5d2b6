#pragma once

/**
 * @file quadfetch.hpp
 * @brief Main header for QuadFetch
 *
 * Shared value types for the catalog walker, tile downloader and
 * orchestrator: bounding boxes, catalog records, download outcomes,
 * retry policies, the error taxonomy and the run configuration.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace quadfetch {

// ============================================================================
// Geometry
// ============================================================================

/**
 * @brief Axis-aligned rectangle (min_x, min_y, max_x, max_y) in degrees
 */
struct BoundingBox {
    double min_x, min_y, max_x, max_y;

    BoundingBox() : min_x(0.0), min_y(0.0), max_x(0.0), max_y(0.0) {}
    BoundingBox(double minx, double miny, double maxx, double maxy)
        : min_x(minx), min_y(miny), max_x(maxx), max_y(maxy) {}

    bool is_valid() const { return min_x <= max_x && min_y <= max_y; }

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }

    /**
     * @brief Comma-joined "min_x,min_y,max_x,max_y" as sent in the bbox query parameter
     */
    std::string to_query_string() const;

    bool operator==(const BoundingBox& other) const {
        return min_x == other.min_x && min_y == other.min_y &&
               max_x == other.max_x && max_y == other.max_y;
    }
};

// ============================================================================
// Catalog records
// ============================================================================

/**
 * @brief One catalog collection (a mosaic, e.g. one imagery epoch)
 */
struct Collection {
    std::string id;
    std::string name;
    std::string temporal_label;  // first_acquired as reported by the catalog
};

/**
 * @brief One downloadable tile (quad)
 *
 * Keyed by (collection_id, tile_id). No two records in the cache or in a
 * single listing session share a key.
 */
struct TileRecord {
    std::string collection_id;
    std::string tile_id;
    BoundingBox bbox;
    double percent_covered = 0.0;  // 0-100 as reported by the catalog
    std::string download_url;

    std::string key() const { return make_key(collection_id, tile_id); }

    double coverage_fraction() const { return percent_covered / 100.0; }

    static std::string make_key(const std::string& collection_id, const std::string& tile_id) {
        return collection_id + '\x1f' + tile_id;
    }

    bool operator==(const TileRecord& other) const {
        return collection_id == other.collection_id && tile_id == other.tile_id &&
               bbox == other.bbox && percent_covered == other.percent_covered &&
               download_url == other.download_url;
    }
};

// ============================================================================
// Download outcomes
// ============================================================================

enum class DownloadStatus {
    DOWNLOADED,       ///< Fetched and written to the final path
    ALREADY_PRESENT,  ///< Final path existed, no network call made
    FAILED            ///< Not written; see message
};

/**
 * @brief Per-tile result of a download attempt
 */
struct DownloadOutcome {
    std::string collection_id;
    std::string tile_id;
    std::string url;
    std::string path;
    DownloadStatus status = DownloadStatus::FAILED;
    std::string message;
    std::uintmax_t bytes_written = 0;

    bool ok() const { return status != DownloadStatus::FAILED; }
};

std::string to_string(DownloadStatus status);

// ============================================================================
// Retry policy
// ============================================================================

enum class BackoffMode {
    CONSTANT,    ///< Same delay after every failed attempt
    EXPONENTIAL  ///< base_delay * 2^attempt
};

/**
 * @brief Bounded retry schedule for one kind of remote call
 */
struct RetryPolicy {
    int max_attempts = 5;
    std::chrono::milliseconds base_delay{2000};
    BackoffMode backoff = BackoffMode::EXPONENTIAL;

    /**
     * @brief Delay to wait after the given zero-based attempt failed
     */
    std::chrono::milliseconds delay_after(int attempt) const;

    /// Catalog root listing: 5 attempts, constant 10 s
    static RetryPolicy catalog_default() {
        return RetryPolicy{5, std::chrono::milliseconds(10000), BackoffMode::CONSTANT};
    }

    /// Item pages: 5 attempts, 2 s doubling
    static RetryPolicy page_default() {
        return RetryPolicy{5, std::chrono::milliseconds(2000), BackoffMode::EXPONENTIAL};
    }
};

// ============================================================================
// Errors
// ============================================================================

enum class ErrorKind {
    TRANSIENT_NETWORK,  ///< Timeouts, resets, 5xx; retried
    PERMANENT_REQUEST,  ///< 4xx, malformed URL; not retried
    RETRY_EXHAUSTED,    ///< Transient failures hit the attempt bound
    CACHE_IO,           ///< Cache file unreadable or unwritable
    FILESYSTEM,         ///< Tile write failure
    CONFIGURATION       ///< Invalid settings
};

std::string to_string(ErrorKind kind);

/**
 * @brief Exception carrying an ErrorKind
 */
class FetchError : public std::runtime_error {
public:
    FetchError(ErrorKind kind, const std::string& message)
        : std::runtime_error(to_string(kind) + ": " + message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Run configuration, built once and handed to each component
 */
struct FetchConfig {
    // Catalog service
    std::string api_base_url = "https://api.planet.com/basemaps/v1/mosaics";
    std::string collection_prefix = "nicfi";
    std::string api_key;
    std::string api_key_file = "/sciclone/geograd/.keys/NICFI_planet.key";

    // Region of interest: explicit bbox wins over region_file
    std::optional<BoundingBox> bbox;
    std::string region_file = "region.geojson";

    // Local storage
    std::string output_directory = "output";
    std::string log_directory = "logs";
    std::string cache_file;  // empty: <output_directory>/quad_cache.json

    // Transfer tuning
    int page_size = 250;
    int concurrency = 5;
    int request_timeout_seconds = 60;
    int download_timeout_seconds = 300;
    RetryPolicy catalog_retry = RetryPolicy::catalog_default();
    RetryPolicy page_retry = RetryPolicy::page_default();

    // Run control
    int max_collections = 0;  // 0 = no limit
    std::string log_config = "3";

    std::string resolved_cache_file() const;
};

} // namespace quadfetch
