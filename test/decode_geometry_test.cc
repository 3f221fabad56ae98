#include "catch2/catch.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "vtile/decode_error.h"
#include "vtile/mvt/algo/signed_area.h"
#include "vtile/mvt/decode_geometry.h"

#include "test_tile_builder.h"

using namespace vtile;
using namespace vtile::test;

namespace {

template <typename Range>
std::vector<xy> pts(Range const& r) {
  return {begin(r), end(r)};
}

geometry decode(ttm::GeomType type, std::vector<uint32_t> const& stream) {
  std::vector<std::string> warnings;
  auto geo = decode_geometry(type, stream, 0, warnings);
  CHECK(warnings.empty());
  return geo;
}

decode_error decode_fails(ttm::GeomType type,
                          std::vector<uint32_t> const& stream) {
  std::vector<std::string> warnings;
  try {
    decode_geometry(type, stream, 77, warnings);
  } catch (decode_error const& e) {
    CHECK(e.kind() == error_kind::malformed_geometry);
    CHECK(e.offset() == 77);
    return e;
  }
  FAIL("no decode_error thrown");
  throw std::logic_error{"unreachable"};
}

}  // namespace

TEST_CASE("decode_geometry point") {
  // MoveTo(1) +25 +17
  auto const geo = decode(ttm::GeomType::POINT, {9, 50, 34});
  REQUIRE(mpark::holds_alternative<point_geometry>(geo));
  CHECK(pts(mpark::get<point_geometry>(geo)) == std::vector<xy>{{25, 17}});
}

TEST_CASE("decode_geometry multi point") {
  // MoveTo(2) +5 +7, -8 +2
  auto const geo = decode(ttm::GeomType::POINT, {17, 10, 14, 15, 4});
  REQUIRE(mpark::holds_alternative<point_geometry>(geo));
  CHECK(pts(mpark::get<point_geometry>(geo)) ==
        std::vector<xy>{{5, 7}, {-3, 9}});
}

TEST_CASE("decode_geometry linestring") {
  geometry_encoder enc;
  enc.line({{2, 2}, {2, 10}, {10, 10}});

  auto const geo = decode(ttm::GeomType::LINESTRING, enc.stream_);
  REQUIRE(mpark::holds_alternative<linestring_geometry>(geo));
  auto const& lines = mpark::get<linestring_geometry>(geo);
  REQUIRE(lines.size() == 1);
  CHECK(pts(lines[0]) == std::vector<xy>{{2, 2}, {2, 10}, {10, 10}});
}

TEST_CASE("decode_geometry multi linestring") {
  geometry_encoder enc;
  enc.line({{2, 2}, {2, 10}, {10, 10}});
  enc.line({{1, 1}, {3, 5}});

  auto const geo = decode(ttm::GeomType::LINESTRING, enc.stream_);
  REQUIRE(mpark::holds_alternative<linestring_geometry>(geo));
  auto const& lines = mpark::get<linestring_geometry>(geo);
  REQUIRE(lines.size() == 2);
  CHECK(pts(lines[0]) == std::vector<xy>{{2, 2}, {2, 10}, {10, 10}});
  CHECK(pts(lines[1]) == std::vector<xy>{{1, 1}, {3, 5}});
}

TEST_CASE("decode_geometry polygon") {
  geometry_encoder enc;
  enc.ring({{0, 0}, {10, 0}, {10, 10}, {0, 10}});

  auto const geo = decode(ttm::GeomType::POLYGON, enc.stream_);
  REQUIRE(mpark::holds_alternative<polygon_geometry>(geo));
  auto const& polygons = mpark::get<polygon_geometry>(geo);
  REQUIRE(polygons.size() == 1);
  CHECK(pts(polygons[0].outer()) ==
        std::vector<xy>{{0, 0}, {10, 0}, {10, 10}, {0, 10}, {0, 0}});
  CHECK(polygons[0].inners().empty());
  CHECK(signed_area(polygons[0].outer()) == 100.0);
}

TEST_CASE("decode_geometry polygon with hole") {
  geometry_encoder enc;
  enc.ring({{0, 0}, {10, 0}, {10, 10}, {0, 10}});
  enc.ring({{2, 2}, {2, 8}, {8, 8}, {8, 2}});

  auto const geo = decode(ttm::GeomType::POLYGON, enc.stream_);
  REQUIRE(mpark::holds_alternative<polygon_geometry>(geo));
  auto const& polygons = mpark::get<polygon_geometry>(geo);
  REQUIRE(polygons.size() == 1);
  REQUIRE(polygons[0].inners().size() == 1);
  CHECK(pts(polygons[0].inners()[0]) ==
        std::vector<xy>{{2, 2}, {2, 8}, {8, 8}, {8, 2}, {2, 2}});
  CHECK(signed_area(polygons[0].inners()[0]) < 0.0);
}

TEST_CASE("decode_geometry multi polygon") {
  geometry_encoder enc;
  enc.ring({{0, 0}, {10, 0}, {10, 10}, {0, 10}});
  enc.ring({{2, 2}, {2, 8}, {8, 8}, {8, 2}});
  enc.ring({{20, 0}, {30, 0}, {30, 10}});

  auto const geo = decode(ttm::GeomType::POLYGON, enc.stream_);
  REQUIRE(mpark::holds_alternative<polygon_geometry>(geo));
  auto const& polygons = mpark::get<polygon_geometry>(geo);
  REQUIRE(polygons.size() == 2);
  CHECK(polygons[0].inners().size() == 1);
  CHECK(polygons[1].inners().empty());
  CHECK(pts(polygons[1].outer()) ==
        std::vector<xy>{{20, 0}, {30, 0}, {30, 10}, {20, 0}});
}

TEST_CASE("decode_geometry polygon with large coordinates") {
  // largest deltas zigzag32 can carry; the square side is two deltas long
  constexpr coord_t h = std::numeric_limits<int32_t>::max();
  constexpr coord_t s = 2 * h;

  geometry_encoder enc;
  enc.ring({{0, 0}, {h, 0}, {s, 0}, {s, h}, {s, s}, {h, s}, {0, s}, {0, h}});
  enc.ring({{0, 0}, {0, h}, {0, s}, {h, s}, {s, s}, {s, h}, {s, 0}, {h, 0}});

  auto const geo = decode(ttm::GeomType::POLYGON, enc.stream_);
  REQUIRE(mpark::holds_alternative<polygon_geometry>(geo));
  auto const& polygons = mpark::get<polygon_geometry>(geo);
  REQUIRE(polygons.size() == 1);
  CHECK(polygons[0].outer().size() == 9);
  CHECK(polygons[0].inners().size() == 1);
  CHECK(signed_area(polygons[0].outer()) > 0.0);
  CHECK(signed_area(polygons[0].inners()[0]) < 0.0);
}

TEST_CASE("decode_geometry hole before exterior") {
  geometry_encoder enc;
  enc.ring({{2, 2}, {2, 8}, {8, 8}, {8, 2}});
  enc.ring({{0, 0}, {10, 0}, {10, 10}, {0, 10}});

  std::vector<std::string> warnings;
  auto const geo =
      decode_geometry(ttm::GeomType::POLYGON, enc.stream_, 0, warnings);

  REQUIRE(warnings.size() == 1);
  CHECK(warnings[0] == "interior ring 0 without exterior ring");

  REQUIRE(mpark::holds_alternative<polygon_geometry>(geo));
  auto const& polygons = mpark::get<polygon_geometry>(geo);
  REQUIRE(polygons.size() == 2);
  CHECK(polygons[0].outer().empty());
  CHECK(polygons[0].inners().size() == 1);
  CHECK(polygons[1].outer().size() == 5);
}

TEST_CASE("decode_geometry null") {
  CHECK(mpark::holds_alternative<null_geometry>(
      decode(ttm::GeomType::POINT, {})));
  CHECK(mpark::holds_alternative<null_geometry>(
      decode(ttm::GeomType::POLYGON, {})));
  CHECK(mpark::holds_alternative<null_geometry>(
      decode(ttm::GeomType::UNKNOWN, {9, 50, 34})));
}

TEST_CASE("decode_geometry errors") {
  SECTION("ClosePath count two") {
    geometry_encoder enc;
    enc.move_to({0, 0});
    enc.line_to({{10, 0}, {10, 10}});
    enc.stream_.push_back(encode_command(ttm::CLOSE_PATH, 2));
    decode_fails(ttm::GeomType::POLYGON, enc.stream_);
  }

  SECTION("parameter underflow") {
    // LineTo(3) with only four parameters
    decode_fails(ttm::GeomType::LINESTRING, {9, 0, 0, 26, 2, 2, 2, 2});
  }

  SECTION("trailing parameter") {
    // the stray value is read as a command with id 2 and count 0
    decode_fails(ttm::GeomType::POINT, {9, 50, 34, 2});
  }

  SECTION("MoveTo count zero") {
    decode_fails(ttm::GeomType::POINT, {encode_command(ttm::MOVE_TO, 0)});
  }

  SECTION("ClosePath in linestring") {
    geometry_encoder enc;
    enc.line({{0, 0}, {5, 5}});
    enc.close_path();
    decode_fails(ttm::GeomType::LINESTRING, enc.stream_);
  }

  SECTION("LineTo before MoveTo") {
    decode_fails(ttm::GeomType::LINESTRING,
                 {encode_command(ttm::LINE_TO, 1), 2, 2});
  }

  SECTION("linestring with single point") {
    geometry_encoder enc;
    enc.move_to({1, 1});
    enc.line({{5, 5}, {6, 6}});
    decode_fails(ttm::GeomType::LINESTRING, enc.stream_);
  }

  SECTION("linestring MoveTo count two") {
    geometry_encoder enc;
    enc.move_to_points({{0, 0}, {1, 1}});
    enc.line_to({{2, 2}});
    decode_fails(ttm::GeomType::LINESTRING, enc.stream_);
  }

  SECTION("LineTo in point geometry") {
    geometry_encoder enc;
    enc.line({{0, 0}, {5, 5}});
    decode_fails(ttm::GeomType::POINT, enc.stream_);
  }

  SECTION("unclosed ring") {
    geometry_encoder enc;
    enc.line({{0, 0}, {10, 0}, {10, 10}});
    decode_fails(ttm::GeomType::POLYGON, enc.stream_);
  }

  SECTION("MoveTo inside open ring") {
    geometry_encoder enc;
    enc.line({{0, 0}, {10, 0}, {10, 10}});
    enc.ring({{20, 0}, {30, 0}, {30, 10}});
    decode_fails(ttm::GeomType::POLYGON, enc.stream_);
  }

  SECTION("ring with two points") {
    geometry_encoder enc;
    enc.ring({{0, 0}, {10, 0}});
    decode_fails(ttm::GeomType::POLYGON, enc.stream_);
  }

  SECTION("unknown command") {
    decode_fails(ttm::GeomType::POLYGON, {encode_command(ttm::command{4}, 1)});
  }
}
