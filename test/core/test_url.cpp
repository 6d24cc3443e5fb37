#include <catch2/catch_test_macros.hpp>

#include <superbox/core/url.hpp>

using namespace superbox;

TEST_CASE("UrlEncode: unreserved chars passthrough", "[core][url]") {
    CHECK(UrlEncode("my-server_v1.2~x") == "my-server_v1.2~x");
}

TEST_CASE("UrlEncode: slash and space encoded", "[core][url]") {
    CHECK(UrlEncode("a/b c") == "a%2Fb%20c");
}

TEST_CASE("UrlEncode: empty string", "[core][url]") {
    CHECK(UrlEncode("") == "");
}
