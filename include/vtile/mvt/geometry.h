#pragma once

#include <cstdint>
#include <tuple>
#include <variant>

#include "boost/geometry/geometries/linestring.hpp"
#include "boost/geometry/geometries/multi_linestring.hpp"
#include "boost/geometry/geometries/multi_point.hpp"
#include "boost/geometry/geometries/multi_polygon.hpp"
#include "boost/geometry/geometries/point_xy.hpp"
#include "boost/geometry/geometries/polygon.hpp"

#include "mpark/variant.hpp"

namespace vtile {

// tile local coordinates, relative to the layer extent
using coord_t = int64_t;

using xy = boost::geometry::model::d2::point_xy<coord_t>;

using line = boost::geometry::model::linestring<xy>;
using simple_polygon = boost::geometry::model::polygon<xy>;
using ring = simple_polygon::ring_type;

using null_geometry = std::monostate;
using point_geometry = boost::geometry::model::multi_point<xy>;
using linestring_geometry = boost::geometry::model::multi_linestring<line>;
using polygon_geometry =
    boost::geometry::model::multi_polygon<simple_polygon>;

using geometry = mpark::variant<null_geometry, point_geometry,
                                linestring_geometry, polygon_geometry>;

}  // namespace vtile

namespace boost {
namespace geometry {
namespace model {
namespace d2 {

inline bool operator==(point_xy<vtile::coord_t> const& lhs,
                       point_xy<vtile::coord_t> const& rhs) {
  return std::tie(lhs.x(), lhs.y()) == std::tie(rhs.x(), rhs.y());
}

inline bool operator!=(point_xy<vtile::coord_t> const& lhs,
                       point_xy<vtile::coord_t> const& rhs) {
  return !(lhs == rhs);
}

}  // namespace d2
}  // namespace model
}  // namespace geometry
}  // namespace boost
