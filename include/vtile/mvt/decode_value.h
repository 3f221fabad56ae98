#pragma once

#include <string_view>

#include "vtile/mvt/tile.h"

namespace vtile {

// decodes one Value message; buf is the message body starting at
// base_offset in the tile buffer
value decode_value(std::string_view buf, size_t base_offset);

}  // namespace vtile
