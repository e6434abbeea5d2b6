#include <catch2/catch.hpp>

#include "TestSupport.hpp"
#include "CatalogFixtures.hpp"
#include "cli/FetchOrchestrator.hpp"

using namespace quadfetch;
using namespace quadfetch::test;

namespace {

FetchConfig run_config(const TempDirectory& dir) {
    FetchConfig config = catalog_config();
    config.output_directory = (dir / "output").string();
    config.concurrency = 3;
    return config;
}

void script_catalog(ScriptedTransport& transport) {
    transport.add_reply(kCatalogBase, ScriptedReply::ok(mosaics_page({
        mosaic("A", "nicfi_A"), mosaic("B", "nicfi_B"), mosaic("C", "planet_global_C")})));

    const std::string a_page2 = quads_url("A") + "?_page=2";
    transport.add_reply(quads_url("A"), ScriptedReply::ok(
        items_page({quad("A", "q1"), quad("A", "q2"), quad("A", "q3")}, a_page2)));
    transport.add_reply(a_page2, ScriptedReply::ok(items_page({quad("A", "q3"), quad("A", "q4")})));

    transport.add_reply(quads_url("B"), ScriptedReply::status_only(503));

    for (const std::string id : {"q1", "q2", "q3", "q4"}) {
        transport.add_reply(download_url_for("A", id), ScriptedReply::ok("tile " + id));
    }
}

} // namespace

TEST_CASE("A full run downloads one collection and survives another failing") {
    quiet_logging();
    TempDirectory dir;
    ScriptedTransport transport;
    script_catalog(transport);
    RecordingSleeper sleeper;
    const FetchConfig config = run_config(dir);

    FetchOrchestrator orchestrator(config, transport, sleeper);
    REQUIRE(orchestrator.run(*config.bbox));

    const auto collection_dir = dir / "output" / "nicfi_A";
    for (const std::string id : {"q1", "q2", "q3", "q4"}) {
        REQUIRE(read_file(collection_dir / ("A_" + id + ".tif")) == "tile " + id);
    }
    REQUIRE(transport.count_for(quads_url("B")) == 5);
    REQUIRE(transport.count_for(quads_url("C")) == 0);
    REQUIRE_FALSE(std::filesystem::exists(dir / "output" / "nicfi_B"));

    const RunTracker& tracker = orchestrator.get_tracker();
    REQUIRE(tracker.getReports().size() == 2);
    const CollectionReport* a = tracker.findReport("A");
    REQUIRE(a != nullptr);
    REQUIRE(a->tiles_listed == 4);
    REQUIRE(a->downloaded == 4);
    const CollectionReport* b = tracker.findReport("B");
    REQUIRE(b != nullptr);
    REQUIRE(b->tiles_listed == 0);
    REQUIRE_FALSE(b->listing_complete);

    CatalogCache cache(config.resolved_cache_file());
    REQUIRE(cache.load() == 2);
    REQUIRE(cache.get("A").size() == 4);
    REQUIRE(cache.get("B").empty());
}

TEST_CASE("A second run downloads nothing new") {
    quiet_logging();
    TempDirectory dir;
    const FetchConfig config = run_config(dir);

    {
        ScriptedTransport transport;
        script_catalog(transport);
        FetchOrchestrator orchestrator(config, transport, RecordingSleeper{});
        REQUIRE(orchestrator.run(*config.bbox));
    }

    ScriptedTransport transport;
    script_catalog(transport);
    FetchOrchestrator orchestrator(config, transport, RecordingSleeper{});
    REQUIRE(orchestrator.run(*config.bbox));

    for (const std::string id : {"q1", "q2", "q3", "q4"}) {
        REQUIRE(transport.count_for(download_url_for("A", id)) == 0);
    }
    const CollectionReport* a = orchestrator.get_tracker().findReport("A");
    REQUIRE(a != nullptr);
    REQUIRE(a->already_present == 4);
    REQUIRE(a->tiles_discovered == 0);
}

TEST_CASE("A failed collection listing ends the run") {
    quiet_logging();
    TempDirectory dir;
    ScriptedTransport transport;
    transport.add_reply(kCatalogBase, ScriptedReply::status_only(403));
    const FetchConfig config = run_config(dir);

    FetchOrchestrator orchestrator(config, transport, RecordingSleeper{});
    REQUIRE_FALSE(orchestrator.run(*config.bbox));
    REQUIRE(transport.request_count() == 1);
}

TEST_CASE("A collection repeated in the listing is processed once") {
    quiet_logging();
    TempDirectory dir;
    ScriptedTransport transport;
    const std::string page2 = kCatalogBase + "?page=2";
    transport.add_reply(kCatalogBase, ScriptedReply::ok(mosaics_page({mosaic("A", "nicfi_A")}, page2)));
    transport.add_reply(page2, ScriptedReply::ok(mosaics_page({mosaic("A", "nicfi_A")})));
    transport.add_reply(quads_url("A"), ScriptedReply::ok(items_page({quad("A", "q1")})));
    transport.add_reply(download_url_for("A", "q1"), ScriptedReply::ok("tile q1"));
    const FetchConfig config = run_config(dir);

    FetchOrchestrator orchestrator(config, transport, RecordingSleeper{});
    REQUIRE(orchestrator.run(*config.bbox));

    const RunTracker& tracker = orchestrator.get_tracker();
    REQUIRE(tracker.getReports().size() == 1);
    REQUIRE(tracker.getReports()[0].downloaded == 1);
    REQUIRE(tracker.getTotalAlreadyPresent() == 0);
    REQUIRE(transport.count_for(quads_url("A")) == 1);
}

TEST_CASE("Collection folders are encoded and fall back to the id") {
    TempDirectory dir;
    ScriptedTransport transport;
    const FetchConfig config = run_config(dir);
    FetchOrchestrator orchestrator(config, transport, RecordingSleeper{});
    const std::filesystem::path output(config.output_directory);

    REQUIRE(orchestrator.collection_directory(Collection{"A", "nicfi_A", ""}) == output / "nicfi_A");
    REQUIRE(orchestrator.collection_directory(Collection{"A", "nicfi/2020 06", ""}) ==
            output / "nicfi%2F2020%2006");
    REQUIRE(orchestrator.collection_directory(Collection{"A", "nicfi_2020", ""}) !=
            orchestrator.collection_directory(Collection{"B", "nicfi/2020", ""}));
    REQUIRE(orchestrator.collection_directory(Collection{"m-1", "", ""}) == output / "m-1");
}

TEST_CASE("max_collections limits the processed collections") {
    quiet_logging();
    TempDirectory dir;
    ScriptedTransport transport;
    script_catalog(transport);
    FetchConfig config = run_config(dir);
    config.max_collections = 1;

    FetchOrchestrator orchestrator(config, transport, RecordingSleeper{});
    REQUIRE(orchestrator.run(*config.bbox));
    REQUIRE(orchestrator.get_tracker().getReports().size() == 1);
    REQUIRE(transport.count_for(quads_url("B")) == 0);
}

TEST_CASE("An invalid bounding box is rejected before any request") {
    quiet_logging();
    TempDirectory dir;
    ScriptedTransport transport;
    const FetchConfig config = run_config(dir);

    FetchOrchestrator orchestrator(config, transport, RecordingSleeper{});
    REQUIRE_THROWS_AS(orchestrator.run(BoundingBox(5.0, 0.0, 1.0, 1.0)), FetchError);
    REQUIRE(transport.request_count() == 0);
}
