#include <catch2/catch_test_macros.hpp>

#include "warm_transfer/utils/http.hpp"

#include <string>

TEST_CASE("url_encode escapes reserved characters") {
    const std::string input = "hello world!";
    const std::string expected = "hello%20world%21";
    REQUIRE(warm_transfer::utils::url_encode(input) == expected);
}

TEST_CASE("url_encode escapes the plus of an E.164 number") {
    REQUIRE(warm_transfer::utils::url_encode("+15550001111") == "%2B15550001111");
}

TEST_CASE("parse_url splits scheme host port and path") {
    std::string scheme;
    std::string host;
    std::string base_path;
    int port = 0;
    warm_transfer::utils::parse_url("https://example.com:8443/path/file",
                                    scheme, host, port, base_path);
    REQUIRE(scheme == "https");
    REQUIRE(host == "example.com");
    REQUIRE(port == 8443);
    REQUIRE(base_path == "/path/file");
}

TEST_CASE("parse_url falls back to scheme default ports") {
    std::string scheme;
    std::string host;
    std::string base_path;
    int port = 0;
    warm_transfer::utils::parse_url("http://worker.local", scheme, host, port, base_path);
    REQUIRE(port == 80);
    REQUIRE(base_path == "/");
    warm_transfer::utils::parse_url("https://api.example.com/v1", scheme, host, port, base_path);
    REQUIRE(port == 443);
    REQUIRE(base_path == "/v1");
}

TEST_CASE("join_path keeps exactly one slash between segments") {
    using warm_transfer::utils::join_path;
    REQUIRE(join_path("/", "/turn") == "/turn");
    REQUIRE(join_path("", "turn") == "/turn");
    REQUIRE(join_path("/api/", "/turn") == "/api/turn");
    REQUIRE(join_path("/api", "turn") == "/api/turn");
    REQUIRE(join_path("/api", "/turn") == "/api/turn");
}

TEST_CASE("to_ws_url maps http schemes to websocket schemes") {
    using warm_transfer::utils::to_ws_url;
    REQUIRE(to_ws_url("https://backend.example.com") == "wss://backend.example.com");
    REQUIRE(to_ws_url("http://localhost:8080") == "ws://localhost:8080");
    REQUIRE(to_ws_url("localhost:8080") == "ws://localhost:8080");
}

TEST_CASE("build_url omits default ports") {
    REQUIRE(warm_transfer::utils::build_url("https", "example.com", 443, "/x") ==
            "https://example.com/x");
    REQUIRE(warm_transfer::utils::build_url("http", "example.com", 8000, "call") ==
            "http://example.com:8000/call");
}
