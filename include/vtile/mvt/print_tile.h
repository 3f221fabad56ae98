#pragma once

#include <limits>
#include <ostream>
#include <string>
#include <vector>

#include "vtile/mvt/tile.h"

namespace vtile {

constexpr auto kNoLimit = std::numeric_limits<size_t>::max();

// "Point", "MultiPoint", ..., "Unknown"
std::string geometry_type_name(feature const&);

// nested coordinate lists, every nesting level truncated to max_elements
std::string geometry_to_string(geometry const&, size_t max_elements = kNoLimit);

std::string to_json(value const&);
// object with the properties in tag order
std::string to_json(properties const&);

// per layer: name, feature count and the first max_features features
void print_summary(std::ostream&, tile const&, size_t max_features);

void print_geometries(std::ostream&, tile const&, size_t max_features,
                      size_t max_coords);

// one line per feature: "<layer> | <field>=<value> | ..."
void print_fields(std::ostream&, tile const&,
                  std::vector<std::string> const& fields);

}  // namespace vtile
