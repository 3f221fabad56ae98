#pragma once

#include <string_view>
#include <vector>

#include "vtile/decode_error.h"
#include "vtile/mvt/tile.h"

namespace vtile {

// decodes one Layer message; buf is the message body starting at
// base_offset in the tile buffer. Geometry warnings are appended.
layer decode_layer(std::string_view buf, size_t base_offset,
                   std::vector<decode_warning>& warnings);

}  // namespace vtile
