/**
 * @file RunTracker.cpp
 * @brief Implementation of run accounting
 */

#include "RunTracker.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace quadfetch {

RunTracker::RunTracker()
    : run_start_time_(std::chrono::steady_clock::now()), logger_("RunTracker") {
}

void RunTracker::startCollection(const Collection& collection) {
    reports_.emplace_back(collection.id, collection.name);
    logger_.info("Processing collection " + collection.name);
}

void RunTracker::recordListing(const std::string& collection_id, size_t tiles_listed,
                               size_t tiles_discovered, bool complete, const std::string& error) {
    CollectionReport* report = findReport(collection_id);
    if (!report) {
        return;
    }
    report->tiles_listed = tiles_listed;
    report->tiles_discovered = tiles_discovered;
    report->listing_complete = complete;
    report->listing_error = error;

    logger_.info("Found " + std::to_string(tiles_listed) + " quads for collection " +
                 report->collection_name + " (" + std::to_string(tiles_discovered) + " new)");
}

void RunTracker::recordListingFailure(const std::string& collection_id, const std::string& error) {
    CollectionReport* report = findReport(collection_id);
    if (!report) {
        return;
    }
    report->listing_complete = false;
    report->listing_error = error;
}

void RunTracker::recordOutcomes(const std::string& collection_id,
                                const std::vector<DownloadOutcome>& outcomes) {
    CollectionReport* report = findReport(collection_id);
    if (!report) {
        return;
    }
    for (const auto& outcome : outcomes) {
        switch (outcome.status) {
            case DownloadStatus::DOWNLOADED:
                ++report->downloaded;
                report->bytes_written += outcome.bytes_written;
                break;
            case DownloadStatus::ALREADY_PRESENT:
                ++report->already_present;
                break;
            case DownloadStatus::FAILED:
                ++report->failed;
                report->failures.push_back(outcome.tile_id + ": " + outcome.message);
                break;
        }
    }
}

void RunTracker::completeCollection(const std::string& collection_id) {
    CollectionReport* report = findReport(collection_id);
    if (!report) {
        return;
    }
    report->complete();
    logger_.detailed("Collection " + report->collection_name + " finished in " +
                     formatDuration(report->duration()));
}

const CollectionReport* RunTracker::findReport(const std::string& collection_id) const {
    auto it = std::find_if(reports_.begin(), reports_.end(),
                          [&collection_id](const CollectionReport& report) {
                              return report.collection_id == collection_id;
                          });
    return (it != reports_.end()) ? &(*it) : nullptr;
}

CollectionReport* RunTracker::findReport(const std::string& collection_id) {
    auto it = std::find_if(reports_.begin(), reports_.end(),
                          [&collection_id](const CollectionReport& report) {
                              return report.collection_id == collection_id;
                          });
    return (it != reports_.end()) ? &(*it) : nullptr;
}

size_t RunTracker::getTotalListed() const {
    size_t total = 0;
    for (const auto& report : reports_) total += report.tiles_listed;
    return total;
}

size_t RunTracker::getTotalDownloaded() const {
    size_t total = 0;
    for (const auto& report : reports_) total += report.downloaded;
    return total;
}

size_t RunTracker::getTotalAlreadyPresent() const {
    size_t total = 0;
    for (const auto& report : reports_) total += report.already_present;
    return total;
}

size_t RunTracker::getTotalFailed() const {
    size_t total = 0;
    for (const auto& report : reports_) total += report.failed;
    return total;
}

std::uintmax_t RunTracker::getTotalBytes() const {
    std::uintmax_t total = 0;
    for (const auto& report : reports_) total += report.bytes_written;
    return total;
}

std::string RunTracker::getSummary() const {
    std::ostringstream oss;
    oss << "Run summary (" << reports_.size() << " collections):\n";

    for (const auto& report : reports_) {
        oss << "  " << report.collection_name << " [" << report.collection_id << "]: "
            << report.tiles_listed << " listed (" << report.tiles_discovered << " new), "
            << report.downloaded << " downloaded, "
            << report.already_present << " already present, "
            << report.failed << " failed";
        if (report.completed) {
            oss << " in " << formatDuration(report.duration());
        }
        oss << "\n";
        if (!report.listing_complete) {
            oss << "    listing incomplete: " << report.listing_error << "\n";
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - run_start_time_);
    oss << "Total: " << getTotalListed() << " listed, "
        << getTotalDownloaded() << " downloaded (" << formatFileSize(getTotalBytes()) << "), "
        << getTotalAlreadyPresent() << " already present, "
        << getTotalFailed() << " failed, elapsed " << formatDuration(elapsed);
    return oss.str();
}

void RunTracker::logSummary() const {
    std::istringstream lines(getSummary());
    std::string line;
    while (std::getline(lines, line)) {
        logger_.info(line);
    }
    for (const auto& report : reports_) {
        for (const auto& failure : report.failures) {
            logger_.detailed("  failed in " + report.collection_name + ": " + failure);
        }
    }
}

void RunTracker::clear() {
    reports_.clear();
    run_start_time_ = std::chrono::steady_clock::now();
}

std::string RunTracker::formatDuration(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    } else if (ms < 60000) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << (ms / 1000.0) << "s";
        return oss.str();
    } else {
        auto minutes = ms / 60000;
        auto seconds = (ms % 60000) / 1000;
        return std::to_string(minutes) + "m" + std::to_string(seconds) + "s";
    }
}

std::string RunTracker::formatFileSize(std::uintmax_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB"};
    double size = static_cast<double>(bytes);
    int unit = 0;

    while (size >= 1024 && unit < 3) {
        size /= 1024;
        unit++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size << " " << units[unit];
    return oss.str();
}

} // namespace quadfetch
