#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "api/http_client.hpp"

using namespace hashcalc::marketdata;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("HttpClient constructor", "[http_client]") {
    SECTION("Keeps base URL and timeout") {
        HttpClient client("https://api.blockchain.info", 5000);
        REQUIRE(client.base_url() == "https://api.blockchain.info");
        REQUIRE(client.timeout_ms() == 5000);
    }

    SECTION("Trailing slash is dropped") {
        HttpClient client("https://query1.finance.yahoo.com/");
        REQUIRE(client.base_url() == "https://query1.finance.yahoo.com");
        REQUIRE(client.timeout_ms() == 60000);
    }
}

TEST_CASE("Retryable status codes", "[http_client]") {
    REQUIRE(HttpClient::should_retry(408));
    REQUIRE(HttpClient::should_retry(429));
    REQUIRE(HttpClient::should_retry(500));
    REQUIRE(HttpClient::should_retry(503));
    REQUIRE_FALSE(HttpClient::should_retry(0));
    REQUIRE_FALSE(HttpClient::should_retry(200));
    REQUIRE_FALSE(HttpClient::should_retry(400));
    REQUIRE_FALSE(HttpClient::should_retry(404));
    REQUIRE_FALSE(HttpClient::should_retry(600));
}

TEST_CASE("URL building escapes parameter values", "[http_client]") {
    HttpClient client("https://api.blockchain.info");

    SECTION("No parameters") {
        REQUIRE(client.build_url("/charts/hash-rate", {}) == "https://api.blockchain.info/charts/hash-rate");
    }

    SECTION("Parameters in key order") {
        auto url = client.build_url("/charts/difficulty", {{"timespan", "all"}, {"format", "json"}});
        REQUIRE(url == "https://api.blockchain.info/charts/difficulty?format=json&timespan=all");
    }

    SECTION("Reserved characters are percent-encoded") {
        auto url = client.build_url("/v8/finance/chart/BTC-USD", {{"q", "a b&c"}});
        REQUIRE(url == "https://api.blockchain.info/v8/finance/chart/BTC-USD?q=a%20b%26c");
    }

    SECTION("Existing query string is extended") {
        auto url = client.build_url("/charts/fees?cors=true", {{"format", "json"}});
        REQUIRE(url == "https://api.blockchain.info/charts/fees?cors=true&format=json");
    }
}

TEST_CASE("Connection failure is reported without retries", "[http_client]") {
    // Nothing listens on port 1; a refused connection is not retryable
    HttpClient client("http://127.0.0.1:1", 2000);
    client.set_retry_delays(std::chrono::milliseconds(0), std::chrono::milliseconds(0),
                            std::chrono::milliseconds(0));

    try {
        client.get("/charts/hash-rate");
        FAIL("expected HttpClientError");
    } catch (const HttpClientError& e) {
        REQUIRE(e.status_code() == 0);
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("CURL error"));
    }
}
