#include <catch2/catch_test_macros.hpp>

#include "warm_transfer/utils/text.hpp"

#include <string>

using namespace warm_transfer::utils;

TEST_CASE("normalize_text lowercases and trims whitespace") {
    const std::string input = "  Hello\tWORLD  ";
    const std::string expected = "hello world";
    REQUIRE(normalize_text(input) == expected);
}

TEST_CASE("normalize_text folds punctuation into single spaces") {
    REQUIRE(normalize_text("Pricing?! For... teams") == "pricing for teams");
    REQUIRE(normalize_text("I'm ready") == "i'm ready");
}

TEST_CASE("contains_phrase matches whole words only") {
    REQUIRE(contains_phrase("What's the PRICE, roughly?", "price"));
    REQUIRE(contains_phrase("Can I speak to someone?", "speak to someone"));
    REQUIRE_FALSE(contains_phrase("That is priceless", "price"));
    REQUIRE_FALSE(contains_phrase("We use an apiary", "api"));
    REQUIRE_FALSE(contains_phrase("anything", ""));
}

TEST_CASE("find_phone_number extracts a dialable number") {
    REQUIRE(find_phone_number("call me at 415-555-0134 tomorrow") == std::string("+4155550134"));
    REQUIRE(find_phone_number("my number is +1 (415) 555 0134") == std::string("+14155550134"));
    REQUIRE_FALSE(find_phone_number("we have 12 people"));
}

TEST_CASE("sanitize_for_speech strips emoji and markup") {
    const std::string emoji = "\xF0\x9F\x98\x80";
    REQUIRE(sanitize_for_speech("Hello " + emoji + " **world**") == "Hello  world");
    REQUIRE(sanitize_for_speech("Plain text only.") == "Plain text only.");
}

TEST_CASE("join separates items") {
    REQUIRE(join({"a", "b", "c"}, "; ") == "a; b; c");
    REQUIRE(join({}, ", ").empty());
}
