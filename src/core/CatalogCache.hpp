/**
 * @file CatalogCache.hpp
 * @brief Durable store of discovered tile records, keyed by collection id
 *
 * The store is a JSON object mapping each collection id to its ordered list
 * of tile records. It is loaded once at start and flushed after each
 * collection's listing so an interrupted run resumes without re-listing
 * known tiles.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "quadfetch.hpp"
#include "Logger.hpp"
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace quadfetch {

class CatalogCache {
public:
    explicit CatalogCache(std::filesystem::path store_path);

    /**
     * @brief Replace the in-memory store with the contents of the backing file
     *
     * A missing file yields an empty store. A file that cannot be read or
     * parsed is moved aside to "<file>.corrupt" and the store starts empty.
     * A leftover "<file>.tmp" from an interrupted flush is discarded.
     *
     * @return Number of collections loaded
     */
    std::size_t load();

    /**
     * @brief Records for a collection, in insertion order (empty if absent)
     */
    std::vector<TileRecord> get(const std::string& collection_id) const;

    /**
     * @brief Replace one collection's entry (in memory only until flush())
     */
    void put(const std::string& collection_id, std::vector<TileRecord> records);

    /**
     * @brief Atomically persist the whole store
     *
     * Writes "<file>.tmp" and renames it over the store, so a crash leaves
     * either the previous or the new file. Concurrent calls are serialized.
     *
     * @throws FetchError CACHE_IO if the file cannot be written
     */
    void flush();

    bool contains(const std::string& collection_id) const;
    std::size_t collection_count() const;
    std::size_t record_count() const;

    const std::filesystem::path& store_path() const { return store_path_; }

private:
    std::filesystem::path store_path_;
    std::map<std::string, std::vector<TileRecord>> store_;
    mutable std::mutex store_mutex_;
    std::mutex flush_mutex_;
    Logger logger_;

    std::filesystem::path temp_path() const;
    void quarantine_corrupt_file(const std::string& reason);
};

} // namespace quadfetch
