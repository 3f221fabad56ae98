#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vtile {

// decoded key / value pairs in query order, blank values kept
using query_items = std::vector<std::pair<std::string, std::string>>;

query_items parse_query(std::string_view query);

// application/x-www-form-urlencoded, space as '+'
std::string encode_query(query_items const&);

// Rewrites the "filters[0]" parameter of a tile request url:
//  - nullopt: url unchanged
//  - "any": filter removed
//  - otherwise: filters[0]=matched IN ('<choice>'), appended last
std::string adjust_matched_filter(std::string const& url,
                                  std::optional<std::string> const& choice);

}  // namespace vtile
