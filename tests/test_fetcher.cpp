#include <catch2/catch.hpp>

#include "test_helpers.hpp"

#include "cancellation.hpp"
#include "errors.hpp"
#include "image_fetcher.hpp"
#include "retry_policy.hpp"

#include <chrono>

using namespace std::chrono_literals;

namespace {

const std::string kUrl = "https://img.test/ch1/001.png";

RetryPolicy fast_policy(int attempts = 3) {
    RetryPolicy p;
    p.max_attempts = attempts;
    p.base_delay = 0ms;
    p.max_delay = 0ms;
    return p;
}

struct Failure {
    int attempt;
    bool retry;
};

} // namespace

TEST_CASE("Backoff doubles up to the ceiling", "[fetcher]") {
    RetryPolicy p;
    CHECK(p.backoff_before(1) == 0ms);
    CHECK(p.backoff_before(2) == 500ms);
    CHECK(p.backoff_before(3) == 1000ms);
    CHECK(p.backoff_before(4) == 2000ms);
    CHECK(p.backoff_before(6) == 8000ms);
    CHECK(p.backoff_before(12) == 8000ms);
}

TEST_CASE("A valid image is returned with its dimensions and the referer is sent", "[fetcher]") {
    FakeTransport transport;
    transport.serve(kUrl, ok(make_pnm(40, 90)));
    ImageFetcher fetcher(transport, fast_policy(), 0ms);

    ImageAsset asset = fetcher.fetch(kUrl, "https://site.test/chapter-1");

    CHECK(asset.source_url == kUrl);
    CHECK(asset.width == 40);
    CHECK(asset.height == 90);
    CHECK(asset.bytes == make_pnm(40, 90));
    auto headers = transport.last_headers();
    CHECK(headers["Referer"] == "https://site.test/chapter-1");
    CHECK(transport.calls(kUrl) == 1);
}

TEST_CASE("WebP and JPEG payloads are accepted", "[fetcher]") {
    FakeTransport transport;
    ImageFetcher fetcher(transport, fast_policy(), 0ms);

    SECTION("webp") {
        transport.serve(kUrl, ok(webp_1x1()));
        ImageAsset asset = fetcher.fetch(kUrl, "");
        CHECK(asset.width == 1);
        CHECK(asset.height == 1);
        CHECK(asset.bytes == webp_1x1());
    }
    SECTION("jpeg") {
        transport.serve(kUrl, ok(jpeg_2x2()));
        ImageAsset asset = fetcher.fetch(kUrl, "");
        CHECK(asset.width == 2);
        CHECK(asset.height == 2);
    }
    CHECK(transport.calls(kUrl) == 1);
}

TEST_CASE("Client errors fail at once without retrying", "[fetcher]") {
    FakeTransport transport;
    transport.serve(kUrl, http_status(403));
    ImageFetcher fetcher(transport, fast_policy(), 0ms);

    try {
        fetcher.fetch(kUrl, "");
        FAIL("expected AssetError");
    } catch (const AssetError& e) {
        CHECK_FALSE(e.transient());
        CHECK(e.url() == kUrl);
    }
    CHECK(transport.calls(kUrl) == 1);
}

TEST_CASE("Server errors are retried up to the attempt bound", "[fetcher]") {
    FakeTransport transport;
    transport.serve(kUrl, http_status(503));
    ImageFetcher fetcher(transport, fast_policy(4), 0ms);

    std::vector<Failure> failures;
    auto onFailure = [&](const std::string&, int attempt, bool retry, const std::string&) {
        failures.push_back({attempt, retry});
    };

    try {
        fetcher.fetch(kUrl, "", onFailure);
        FAIL("expected AssetError");
    } catch (const AssetError& e) {
        CHECK(e.transient());
    }
    CHECK(transport.calls(kUrl) == 4);
    REQUIRE(failures.size() == 4);
    CHECK(failures[0].attempt == 1);
    CHECK(failures[0].retry);
    CHECK(failures[3].attempt == 4);
    CHECK_FALSE(failures[3].retry);
}

TEST_CASE("A transient failure followed by success yields the image", "[fetcher]") {
    FakeTransport transport;
    transport.script(kUrl, {network_error(), http_status(429), ok(make_pnm(10, 10))});
    ImageFetcher fetcher(transport, fast_policy(3), 0ms);

    ImageAsset asset = fetcher.fetch(kUrl, "");
    CHECK(asset.width == 10);
    CHECK(transport.calls(kUrl) == 3);
}

TEST_CASE("Payloads that are not images are rejected without retrying", "[fetcher]") {
    FakeTransport transport;
    ImageFetcher fetcher(transport, fast_policy(), 0ms);

    SECTION("html error page served with 200") {
        transport.serve(kUrl, ok("<html><body>rate limited</body></html>"));
    }
    SECTION("empty body") {
        transport.serve(kUrl, ok(""));
    }
    SECTION("png signature followed by junk") {
        transport.serve(kUrl, ok(std::string("\x89PNG\r\n\x1a\n", 8) + "not really a png"));
    }

    CHECK_THROWS_AS(fetcher.fetch(kUrl, ""), AssetError);
    CHECK(transport.calls(kUrl) == 1);
}

TEST_CASE("A cancelled token stops further retries", "[fetcher]") {
    FakeTransport transport;
    transport.serve(kUrl, http_status(500));
    CancellationToken cancel;
    ImageFetcher fetcher(transport, fast_policy(5), 0ms, &cancel);

    auto onFailure = [&](const std::string&, int, bool, const std::string&) { cancel.cancel(); };
    CHECK_THROWS_AS(fetcher.fetch(kUrl, "", onFailure), AssetError);
    CHECK(transport.calls(kUrl) == 1);
}

TEST_CASE("Successive requests are spaced by the inter-image delay", "[fetcher]") {
    FakeTransport transport;
    transport.serve(kUrl, ok(make_pnm(4, 4)));
    ImageFetcher fetcher(transport, fast_policy(), 40ms);

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 3; ++i) fetcher.fetch(kUrl, "");
    // the first request goes out at once, the others wait their turn
    CHECK(std::chrono::steady_clock::now() - start >= 80ms);
}

TEST_CASE("Cancellation wakes a pending wait early", "[fetcher]") {
    CancellationToken cancel;
    CHECK(cancel.wait_for(0ms));
    CHECK(cancel.wait_for(1ms));

    cancel.cancel();
    auto start = std::chrono::steady_clock::now();
    CHECK_FALSE(cancel.wait_for(10s));
    CHECK(std::chrono::steady_clock::now() - start < 5s);
    CHECK(cancel.cancelled());
}
