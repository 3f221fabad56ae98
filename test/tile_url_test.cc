#include "catch2/catch.hpp"

#include <string>

#include "vtile/tile_url.h"

using namespace vtile;

namespace {

constexpr auto kPositionUrl =
    "https://gateway.api.globalfishingwatch.org/v3/4wings/tile/position/12/"
    "3294/1837"
    "?datasets%5B0%5D=public-global-sentinel2-presence%3Av3.0"
    "&filters%5B0%5D=matched%20IN%20%28%27false%27%29"
    "&format=MVT&max-points=5000";

constexpr auto kPositionUrlBase =
    "https://gateway.api.globalfishingwatch.org/v3/4wings/tile/position/12/"
    "3294/1837"
    "?datasets%5B0%5D=public-global-sentinel2-presence%3Av3.0"
    "&format=MVT&max-points=5000";

}  // namespace

TEST_CASE("tile_url parse_query") {
  CHECK(parse_query("") == query_items{});
  CHECK(parse_query("a=1&&b=&c") ==
        query_items{{"a", "1"}, {"b", ""}, {"c", ""}});
  CHECK(parse_query("filters%5B0%5D=matched+IN+%28%27x%27%29") ==
        query_items{{"filters[0]", "matched IN ('x')"}});
  CHECK(parse_query("k=50%25%zz%4") == query_items{{"k", "50%%zz%4"}});
}

TEST_CASE("tile_url encode_query") {
  CHECK(encode_query({}).empty());
  CHECK(encode_query({{"filters[0]", "matched IN ('true')"},
                      {"range", "a:b,c"},
                      {"safe", "A-z_0.9~"}}) ==
        "filters%5B0%5D=matched+IN+%28%27true%27%29"
        "&range=a%3Ab%2Cc&safe=A-z_0.9~");
  CHECK(encode_query({{"name", "\xC3\x96l"}}) == "name=%C3%96l");
}

TEST_CASE("tile_url adjust_matched_filter") {
  std::string const url{kPositionUrl};

  SECTION("unchanged") {
    CHECK(adjust_matched_filter(url, std::nullopt) == url);
  }

  SECTION("any removes the filter") {
    CHECK(adjust_matched_filter(url, "any") == kPositionUrlBase);
  }

  SECTION("value replaces the filter and goes last") {
    CHECK(adjust_matched_filter(url, "true") ==
          std::string{kPositionUrlBase} +
              "&filters%5B0%5D=matched+IN+%28%27true%27%29");
  }

  SECTION("every filters[0] entry is dropped") {
    CHECK(adjust_matched_filter(
              "http://h/t/1/2/3?filters[0]=a&x=1&filters%5B0%5D=b", "any") ==
          "http://h/t/1/2/3?x=1");
  }

  SECTION("no query") {
    CHECK(adjust_matched_filter("http://h/t/1/2/3", "any") ==
          "http://h/t/1/2/3");
    CHECK(adjust_matched_filter("http://h/t/1/2/3#top", "false") ==
          "http://h/t/1/2/3?filters%5B0%5D=matched+IN+%28%27false%27%29#top");
  }
}
