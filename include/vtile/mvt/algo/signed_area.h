#pragma once

#include "boost/geometry.hpp"

#include "vtile/mvt/geometry.h"

namespace vtile {

// Signed area in tile coordinates (y pointing down), computed in floating
// point. Positive for rings that are clockwise on screen, i.e. exterior
// rings. boost::geometry assumes y pointing up, hence the negation.
inline double signed_area(ring const& r) { return -boost::geometry::area(r); }

}  // namespace vtile
