#include <catch2/catch_test_macros.hpp>
#include "http.hpp"

using namespace eventseq;

TEST_CASE("HttpResponse: ok only for 2xx", "[http]") {
    HttpResponse r;
    REQUIRE_FALSE(r.ok());
    r.status_code = 200;
    REQUIRE(r.ok());
    r.status_code = 204;
    REQUIRE(r.ok());
    r.status_code = 301;
    REQUIRE_FALSE(r.ok());
    r.status_code = 500;
    REQUIRE_FALSE(r.ok());
}

TEST_CASE("url_encode: unreserved characters pass through", "[http]") {
    REQUIRE(url_encode("abcXYZ019-_.~") == "abcXYZ019-_.~");
}

TEST_CASE("url_encode: spaces and reserved characters escaped", "[http]") {
    REQUIRE(url_encode("person enters") == "person%20enters");
    REQUIRE(url_encode("a&b=c") == "a%26b%3Dc");
    REQUIRE(url_encode("x/y?z") == "x%2Fy%3Fz");
}

TEST_CASE("url_encode: empty string", "[http]") {
    REQUIRE(url_encode("").empty());
}

TEST_CASE("url_encode: UTF-8 bytes escaped", "[http]") {
    REQUIRE(url_encode("\xc3\xa9") == "%C3%A9");
}
