#include <catch2/catch.hpp>

#include "TestSupport.hpp"
#include "core/RunTracker.hpp"

using namespace quadfetch;
using namespace quadfetch::test;

namespace {

DownloadOutcome outcome(const std::string& tile_id, DownloadStatus status, std::uintmax_t bytes = 0,
                        const std::string& message = "") {
    DownloadOutcome result;
    result.collection_id = "A";
    result.tile_id = tile_id;
    result.status = status;
    result.bytes_written = bytes;
    result.message = message;
    return result;
}

} // namespace

TEST_CASE("RunTracker totals outcomes per collection") {
    quiet_logging();
    RunTracker tracker;

    tracker.startCollection(Collection{"A", "nicfi_A", "2020-01-01"});
    tracker.recordListing("A", 4, 3, true);
    tracker.recordOutcomes("A", {
        outcome("q1", DownloadStatus::DOWNLOADED, 2048),
        outcome("q2", DownloadStatus::DOWNLOADED, 1024),
        outcome("q3", DownloadStatus::ALREADY_PRESENT),
        outcome("q4", DownloadStatus::FAILED, 0, "HTTP 500")
    });
    tracker.completeCollection("A");

    tracker.startCollection(Collection{"B", "nicfi_B", ""});
    tracker.recordListingFailure("B", "HTTP 503 after 5 attempts");
    tracker.completeCollection("B");

    REQUIRE(tracker.getReports().size() == 2);
    REQUIRE(tracker.getTotalListed() == 4);
    REQUIRE(tracker.getTotalDownloaded() == 2);
    REQUIRE(tracker.getTotalAlreadyPresent() == 1);
    REQUIRE(tracker.getTotalFailed() == 1);
    REQUIRE(tracker.getTotalBytes() == 3072);

    const CollectionReport* a = tracker.findReport("A");
    REQUIRE(a != nullptr);
    REQUIRE(a->completed);
    REQUIRE(a->tiles_discovered == 3);
    REQUIRE(a->failures == std::vector<std::string>{"q4: HTTP 500"});

    const CollectionReport* b = tracker.findReport("B");
    REQUIRE(b != nullptr);
    REQUIRE_FALSE(b->listing_complete);

    const std::string summary = tracker.getSummary();
    REQUIRE(summary.find("nicfi_A [A]: 4 listed (3 new), 2 downloaded, 1 already present, 1 failed") !=
            std::string::npos);
    REQUIRE(summary.find("listing incomplete: HTTP 503 after 5 attempts") != std::string::npos);
    REQUIRE(summary.find("2 downloaded (3.0 KB)") != std::string::npos);

    tracker.clear();
    REQUIRE(tracker.getReports().empty());
    REQUIRE(tracker.findReport("A") == nullptr);
}

TEST_CASE("RunTracker ignores unknown collections") {
    quiet_logging();
    RunTracker tracker;
    tracker.recordListing("missing", 3, 3, true);
    tracker.recordOutcomes("missing", {outcome("q1", DownloadStatus::DOWNLOADED, 10)});
    tracker.completeCollection("missing");
    REQUIRE(tracker.getReports().empty());
    REQUIRE(tracker.getTotalDownloaded() == 0);
}

TEST_CASE("RunTracker formats durations and sizes") {
    REQUIRE(RunTracker::formatDuration(std::chrono::milliseconds(250)) == "250ms");
    REQUIRE(RunTracker::formatDuration(std::chrono::milliseconds(1500)) == "1.5s");
    REQUIRE(RunTracker::formatDuration(std::chrono::milliseconds(125000)) == "2m5s");

    REQUIRE(RunTracker::formatFileSize(512) == "512.0 B");
    REQUIRE(RunTracker::formatFileSize(1536) == "1.5 KB");
    REQUIRE(RunTracker::formatFileSize(5ull * 1024 * 1024 * 1024) == "5.0 GB");
}
