/**
 * @file RunTracker.hpp
 * @brief Per-collection accounting and end-of-run summary
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "quadfetch.hpp"
#include "Logger.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace quadfetch {

/**
 * @brief What happened to one collection during a run
 */
struct CollectionReport {
    std::string collection_id;
    std::string collection_name;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    bool completed = false;

    size_t tiles_listed = 0;
    size_t tiles_discovered = 0;   // new this run, not seeded from the cache
    bool listing_complete = true;  // false when a page failed and the listing is partial
    std::string listing_error;

    size_t downloaded = 0;
    size_t already_present = 0;
    size_t failed = 0;
    std::uintmax_t bytes_written = 0;
    std::vector<std::string> failures;  // "<tile id>: <reason>"

    CollectionReport(const std::string& id, const std::string& name)
        : collection_id(id), collection_name(name), start_time(std::chrono::steady_clock::now()) {}

    void complete() {
        end_time = std::chrono::steady_clock::now();
        completed = true;
    }

    std::chrono::milliseconds duration() const {
        if (!completed) return std::chrono::milliseconds(0);
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    }
};

/**
 * @brief Tracks collection reports in processing order
 *
 * Used from the orchestrator thread only.
 */
class RunTracker {
public:
    RunTracker();

    void startCollection(const Collection& collection);
    void recordListing(const std::string& collection_id, size_t tiles_listed, size_t tiles_discovered,
                       bool complete, const std::string& error = "");
    void recordListingFailure(const std::string& collection_id, const std::string& error);
    void recordOutcomes(const std::string& collection_id, const std::vector<DownloadOutcome>& outcomes);
    void completeCollection(const std::string& collection_id);

    const CollectionReport* findReport(const std::string& collection_id) const;
    CollectionReport* findReport(const std::string& collection_id);
    const std::vector<CollectionReport>& getReports() const { return reports_; }

    // Totals across every collection
    size_t getTotalListed() const;
    size_t getTotalDownloaded() const;
    size_t getTotalAlreadyPresent() const;
    size_t getTotalFailed() const;
    std::uintmax_t getTotalBytes() const;

    std::string getSummary() const;
    void logSummary() const;

    void clear();

    static std::string formatDuration(std::chrono::milliseconds duration);
    static std::string formatFileSize(std::uintmax_t bytes);

private:
    std::vector<CollectionReport> reports_;
    std::chrono::steady_clock::time_point run_start_time_;
    mutable Logger logger_;
};

} // namespace quadfetch
