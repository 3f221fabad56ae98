#pragma once

#include <string>
#include <vector>

#include "vtile/mvt/geometry.h"
#include "vtile/mvt/tags.h"

namespace vtile {

// Reconstructs the geometry of one feature from its command stream.
//
// Polygon rings are grouped by winding: a ring with positive signed area
// starts a new polygon, any other ring is a hole of the latest polygon.
// A hole without a preceding exterior ring becomes a polygon with an empty
// exterior ring and a message is appended to warnings.
//
// offset (absolute position of the geometry field) is used for errors.
geometry decode_geometry(tags::mvt::GeomType, std::vector<uint32_t> const&,
                         size_t offset, std::vector<std::string>& warnings);

}  // namespace vtile
