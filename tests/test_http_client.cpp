#include <catch2/catch.hpp>

#include "TestSupport.hpp"
#include "core/HttpClient.hpp"

using namespace quadfetch;
using namespace quadfetch::test;
using std::chrono::milliseconds;

namespace {
const std::string kUrl = "https://catalog.test/v1/mosaics";
}

TEST_CASE("RetryPolicy computes constant and exponential schedules") {
    const RetryPolicy catalog = RetryPolicy::catalog_default();
    REQUIRE(catalog.max_attempts == 5);
    REQUIRE(catalog.delay_after(0) == milliseconds(10000));
    REQUIRE(catalog.delay_after(3) == milliseconds(10000));

    const RetryPolicy page = RetryPolicy::page_default();
    REQUIRE(page.max_attempts == 5);
    REQUIRE(page.delay_after(0) == milliseconds(2000));
    REQUIRE(page.delay_after(1) == milliseconds(4000));
    REQUIRE(page.delay_after(2) == milliseconds(8000));
    REQUIRE(page.delay_after(3) == milliseconds(16000));
}

TEST_CASE("Transient status classification") {
    REQUIRE(is_transient_status(500));
    REQUIRE(is_transient_status(503));
    REQUIRE(is_transient_status(429));
    REQUIRE(is_transient_status(408));
    REQUIRE_FALSE(is_transient_status(400));
    REQUIRE_FALSE(is_transient_status(401));
    REQUIRE_FALSE(is_transient_status(404));
}

TEST_CASE("URL well-formedness") {
    REQUIRE(is_well_formed_url("https://api.example.com/quads/1/full"));
    REQUIRE(is_well_formed_url("http://localhost:8080/x"));
    REQUIRE_FALSE(is_well_formed_url(""));
    REQUIRE_FALSE(is_well_formed_url("not a url"));
    REQUIRE_FALSE(is_well_formed_url("ftp://files.example.com/q.tif"));
}

TEST_CASE("RetryingHttpClient returns the first successful response") {
    quiet_logging();
    ScriptedTransport transport;
    transport.add_reply(kUrl, ScriptedReply::ok("{\"mosaics\":[]}"));
    RecordingSleeper sleeper;
    RetryingHttpClient client(transport, "secret", sleeper);

    HttpResponse response = client.get(kUrl, {}, 60, RetryPolicy::catalog_default());

    REQUIRE(response.status_code == 200);
    REQUIRE(response.body == "{\"mosaics\":[]}");
    REQUIRE(transport.request_count() == 1);
    REQUIRE(sleeper.delays->empty());
}

TEST_CASE("RetryingHttpClient sends the api-key authorization header") {
    quiet_logging();
    ScriptedTransport transport;
    transport.add_reply(kUrl, ScriptedReply::ok("{}"));
    RetryingHttpClient client(transport, "abc123", RecordingSleeper{});

    client.get(kUrl, {}, 60, RetryPolicy::page_default());

    const auto requests = transport.requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(std::find(requests[0].headers.begin(), requests[0].headers.end(),
                      "Authorization: api-key abc123") != requests[0].headers.end());
    REQUIRE(requests[0].timeout_seconds == 60);
}

TEST_CASE("RetryingHttpClient retries transient failures then succeeds") {
    quiet_logging();
    ScriptedTransport transport;
    transport.add_reply(kUrl, ScriptedReply::status_only(503));
    transport.add_reply(kUrl, ScriptedReply::network_failure());
    transport.add_reply(kUrl, ScriptedReply::status_only(429));
    transport.add_reply(kUrl, ScriptedReply::ok("done"));
    RecordingSleeper sleeper;
    RetryingHttpClient client(transport, "k", sleeper);

    HttpResponse response = client.get(kUrl, {}, 60, RetryPolicy::page_default());

    REQUIRE(response.body == "done");
    REQUIRE(transport.request_count() == 4);
    REQUIRE(*sleeper.delays == std::vector<milliseconds>{milliseconds(2000), milliseconds(4000),
                                                         milliseconds(8000)});
}

TEST_CASE("RetryingHttpClient gives up after the attempt bound") {
    quiet_logging();
    ScriptedTransport transport;
    transport.add_reply(kUrl, ScriptedReply::status_only(502));
    RecordingSleeper sleeper;
    RetryingHttpClient client(transport, "k", sleeper);

    SECTION("constant backoff") {
        try {
            client.get(kUrl, {}, 60, RetryPolicy::catalog_default());
            FAIL("expected RETRY_EXHAUSTED");
        } catch (const FetchError& e) {
            REQUIRE(e.kind() == ErrorKind::RETRY_EXHAUSTED);
        }
        REQUIRE(transport.request_count() == 5);
        REQUIRE(sleeper.delays->size() == 4);
        for (const auto& delay : *sleeper.delays) {
            REQUIRE(delay == milliseconds(10000));
        }
    }

    SECTION("single attempt policy never sleeps") {
        RetryPolicy once{1, milliseconds(500), BackoffMode::CONSTANT};
        REQUIRE_THROWS_AS(client.get(kUrl, {}, 60, once), FetchError);
        REQUIRE(transport.request_count() == 1);
        REQUIRE(sleeper.delays->empty());
    }
}

TEST_CASE("RetryingHttpClient does not retry permanent errors") {
    quiet_logging();
    ScriptedTransport transport;
    RecordingSleeper sleeper;
    RetryingHttpClient client(transport, "k", sleeper);

    SECTION("4xx status") {
        transport.add_reply(kUrl, ScriptedReply::status_only(401));
        try {
            client.get(kUrl, {}, 60, RetryPolicy::page_default());
            FAIL("expected PERMANENT_REQUEST");
        } catch (const FetchError& e) {
            REQUIRE(e.kind() == ErrorKind::PERMANENT_REQUEST);
        }
        REQUIRE(transport.request_count() == 1);
    }

    SECTION("malformed URL never reaches the transport") {
        try {
            client.get("not a url", {}, 60, RetryPolicy::page_default());
            FAIL("expected PERMANENT_REQUEST");
        } catch (const FetchError& e) {
            REQUIRE(e.kind() == ErrorKind::PERMANENT_REQUEST);
        }
        REQUIRE(transport.request_count() == 0);
    }

    SECTION("non-positive timeout is a configuration error") {
        try {
            client.get(kUrl, {}, 0, RetryPolicy::page_default());
            FAIL("expected CONFIGURATION");
        } catch (const FetchError& e) {
            REQUIRE(e.kind() == ErrorKind::CONFIGURATION);
        }
        REQUIRE(transport.request_count() == 0);
    }

    REQUIRE(sleeper.delays->empty());
}

TEST_CASE("RetryingHttpClient streams successful bodies through the sink") {
    quiet_logging();
    ScriptedTransport transport;
    transport.add_reply("https://dl.test/q1", ScriptedReply::ok("0123456789"));
    transport.add_reply("https://dl.test/q2", ScriptedReply::status_only(500));
    RetryingHttpClient client(transport, "k", RecordingSleeper{});

    std::string received;
    client.stream("https://dl.test/q1", 300, [&received](const char* data, std::size_t size) {
        received.append(data, size);
        return true;
    });
    REQUIRE(received == "0123456789");

    try {
        client.stream("https://dl.test/q2", 300, [](const char*, std::size_t) { return true; });
        FAIL("expected failure");
    } catch (const FetchError& e) {
        REQUIRE(e.kind() == ErrorKind::TRANSIENT_NETWORK);
    }
    REQUIRE(transport.count_for("https://dl.test/q2") == 1);
}

TEST_CASE("CurlTransport builds encoded query strings") {
    const std::string url = CurlTransport::build_url(
        "https://api.test/mosaics/m1/quads",
        {{"bbox", "-10.5,4.25,-9.75,5"}, {"_page_size", "250"}});
    REQUIRE(url == "https://api.test/mosaics/m1/quads?bbox=-10.5%2C4.25%2C-9.75%2C5&_page_size=250");

    REQUIRE(CurlTransport::build_url("https://api.test/x?a=1", {{"b", "2"}}) == "https://api.test/x?a=1&b=2");
    REQUIRE(CurlTransport::build_url("https://api.test/x", {}) == "https://api.test/x");
}

TEST_CASE("CurlTransport keeps every parameter, including empty ones") {
    const std::string url = CurlTransport::build_url(
        "https://api.test/x", {{"a", ""}, {"b c", "d&e"}, {"f", "1"}});
    REQUIRE(url == "https://api.test/x?a=&b%20c=d%26e&f=1");
    REQUIRE(url.find("&&") == std::string::npos);
}
