/**
 * @file TileDownloader.hpp
 * @brief Bounded-concurrency tile downloader with skip-if-present semantics
 *
 * Each tile maps to a fixed, collision-free path derived from (collection id,
 * tile id), so a re-run addresses the same files and skips those already on
 * disk. Bodies stream to "<path>.part" and are renamed into place only after
 * a complete transfer; a failed transfer never leaves a file at the final path.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "quadfetch.hpp"
#include "HttpClient.hpp"
#include "Logger.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace quadfetch {

class TileDownloader {
public:
    /**
     * @param client Shared client; downloads use its single-attempt stream()
     * @param timeout_seconds Per-download timeout
     */
    TileDownloader(RetryingHttpClient& client, int timeout_seconds);

    /**
     * @brief Download every record into destination_dir
     *
     * Runs up to `concurrency` transfers at once and returns only after all
     * of them finished. Outcomes are in completion order.
     */
    std::vector<DownloadOutcome> download_all(const std::vector<TileRecord>& records,
                                              const std::filesystem::path& destination_dir,
                                              int concurrency);

    /**
     * @brief Download a single record (never throws for per-tile failures)
     */
    DownloadOutcome download_one(const TileRecord& record,
                                 const std::filesystem::path& destination_dir);

    /**
     * @brief "<dir>/<collection id>_<tile id>.tif" with both ids percent-encoded
     *
     * Distinct (collection id, tile id) pairs always map to distinct paths.
     */
    static std::filesystem::path destination_path(const TileRecord& record,
                                                  const std::filesystem::path& destination_dir);

    /**
     * @brief Percent-encode bytes outside [A-Za-z0-9._-] (and '%') as %XX
     *
     * Reversible, so no two inputs share an encoding. "", "." and ".." are
     * encoded too so the result is always a usable file name.
     *
     * @param escape_underscore Also encode '_' (for ids joined with '_')
     */
    static std::string encode_path_component(const std::string& component,
                                             bool escape_underscore = false);

private:
    RetryingHttpClient& client_;
    int timeout_seconds_;
    Logger logger_;

    DownloadOutcome make_outcome(const TileRecord& record, const std::filesystem::path& path) const;
};

} // namespace quadfetch
