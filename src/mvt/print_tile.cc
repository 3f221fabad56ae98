#include "vtile/mvt/print_tile.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <type_traits>

#include "fmt/core.h"
#include "fmt/ostream.h"

namespace vtile {

struct geometry_printer {
  void print(coord_t const c) {
    fmt::format_to(std::back_inserter(out_), "{}", c);
  }

  void print(xy const& p) {
    auto const coords = std::vector<coord_t>{p.x(), p.y()};
    print_list(coords);
  }

  void print(line const& l) { print_list(l); }
  void print(ring const& r) { print_list(r); }

  void print(simple_polygon const& p) {
    out_ += '[';
    auto const n = std::min(1 + p.inners().size(), max_);
    for (auto i = 0ULL; i < n; ++i) {
      if (i != 0) {
        out_ += ", ";
      }
      print(i == 0 ? p.outer() : p.inners()[i - 1]);
    }
    out_ += ']';
  }

  template <typename Range>
  void print_list(Range const& range) {
    out_ += '[';
    auto const n = std::min(static_cast<size_t>(range.size()), max_);
    for (auto i = 0ULL; i < n; ++i) {
      if (i != 0) {
        out_ += ", ";
      }
      print(range[i]);
    }
    out_ += ']';
  }

  // a set with a single part prints as that part
  template <typename Multi>
  void print_multi(Multi const& multi) {
    if (multi.size() == 1) {
      print(multi.front());
    } else {
      print_list(multi);
    }
  }

  size_t max_;
  std::string out_;
};

std::string geometry_type_name(feature const& f) {
  auto const name = [](char const* single, size_t const parts) {
    return parts > 1 ? std::string{"Multi"} + single : std::string{single};
  };

  return mpark::visit(
      [&](auto const& geo) -> std::string {
        using type = std::decay_t<decltype(geo)>;
        if constexpr (std::is_same_v<type, point_geometry>) {
          return name("Point", geo.size());
        } else if constexpr (std::is_same_v<type, linestring_geometry>) {
          return name("LineString", geo.size());
        } else if constexpr (std::is_same_v<type, polygon_geometry>) {
          return name("Polygon", geo.size());
        } else {
          switch (f.type_) {
            case tags::mvt::GeomType::POINT: return "Point";
            case tags::mvt::GeomType::LINESTRING: return "LineString";
            case tags::mvt::GeomType::POLYGON: return "Polygon";
            default: return "Unknown";
          }
        }
      },
      f.geometry_);
}

std::string geometry_to_string(geometry const& g, size_t const max_elements) {
  geometry_printer printer{max_elements, {}};
  mpark::visit(
      [&](auto const& geo) {
        using type = std::decay_t<decltype(geo)>;
        if constexpr (std::is_same_v<type, null_geometry>) {
          printer.out_ = "null";
        } else {
          printer.print_multi(geo);
        }
      },
      g);
  return printer.out_;
}

std::string first_part_to_string(geometry const& g) {
  geometry_printer printer{kNoLimit, "null"};
  mpark::visit(
      [&](auto const& geo) {
        using type = std::decay_t<decltype(geo)>;
        if constexpr (!std::is_same_v<type, null_geometry>) {
          if (!geo.empty()) {
            printer.out_.clear();
            printer.print(geo.front());
          }
        }
      },
      g);
  return printer.out_;
}

std::string escape_json(std::string const& str) {
  std::string out;
  out.reserve(str.size() + 2);
  out += '"';
  for (auto const c : str) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
        } else {
          out += c;
        }
    }
  }
  out += '"';
  return out;
}

template <typename Float>
std::string float_to_json(Float const f) {
  if (std::isnan(f)) {
    return "NaN";
  } else if (std::isinf(f)) {
    return f > 0 ? "Infinity" : "-Infinity";
  }
  return fmt::format("{}", f);
}

std::string to_json(value const& v) {
  return mpark::visit(
      [](auto const& val) -> std::string {
        using type = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<type, null_value>) {
          return "null";
        } else if constexpr (std::is_same_v<type, std::string>) {
          return escape_json(val);
        } else if constexpr (std::is_same_v<type, bool>) {
          return val ? "true" : "false";
        } else if constexpr (std::is_floating_point_v<type>) {
          return float_to_json(val);
        } else {
          return fmt::format("{}", val);
        }
      },
      v);
}

std::string to_json(properties const& props) {
  std::string out = "{";
  for (auto const& [key, val] : props) {
    if (out.size() != 1) {
      out += ", ";
    }
    out += escape_json(key);
    out += ": ";
    out += to_json(val);
  }
  out += "}";
  return out;
}

void print_summary(std::ostream& os, tile const& t, size_t const max_features) {
  if (t.layers_.empty()) {
    fmt::print(os, "No layers found in the tile.\n");
    return;
  }

  for (auto const& l : t.layers_) {
    fmt::print(os, "\nLayer: {} | feature count: {}\n", l.name_,
               l.features_.size());

    auto const n = std::min(max_features, l.features_.size());
    for (auto i = 0ULL; i < n; ++i) {
      auto const& f = l.features_[i];
      fmt::print(os, "  Feature {}: type={} sample_geom={} properties={}\n",
                 i + 1, geometry_type_name(f),
                 first_part_to_string(f.geometry_), to_json(f.properties_));
    }

    if (l.features_.size() > max_features) {
      fmt::print(os, "  ... {} more features omitted ...\n",
                 l.features_.size() - max_features);
    }
  }
}

void print_geometries(std::ostream& os, tile const& t,
                      size_t const max_features, size_t const max_coords) {
  if (t.layers_.empty()) {
    fmt::print(os, "\nNo geometries to display.\n");
    return;
  }

  fmt::print(os, "\nGeometries (max_features={}, max_coords={}):\n",
             max_features, max_coords);
  for (auto const& l : t.layers_) {
    if (l.features_.empty()) {
      continue;
    }

    fmt::print(os, "\nLayer: {}\n", l.name_);
    auto const n = std::min(max_features, l.features_.size());
    for (auto i = 0ULL; i < n; ++i) {
      auto const& f = l.features_[i];
      fmt::print(os, "  Feature {}: type={} geometry={}\n", i + 1,
                 geometry_type_name(f),
                 geometry_to_string(f.geometry_, max_coords));
    }

    if (l.features_.size() > max_features) {
      fmt::print(os, "  ... {} more features omitted ...\n",
                 l.features_.size() - max_features);
    }
  }
}

void print_fields(std::ostream& os, tile const& t,
                  std::vector<std::string> const& fields) {
  if (t.layers_.empty()) {
    fmt::print(os, "\nNo data to list requested fields.\n");
    return;
  }

  std::string names;
  for (auto const& field : fields) {
    names += names.empty() ? field : ", " + field;
  }
  fmt::print(os, "\nRequested fields ({}):\n", names);

  for (auto const& l : t.layers_) {
    for (auto const& f : l.features_) {
      std::string line = l.name_;
      for (auto const& field : fields) {
        auto const* val = find_property(f.properties_, field);
        line += fmt::format(" | {}=", field);
        if (val == nullptr) {
          line += "None";
        } else if (auto const* str = mpark::get_if<std::string>(val);
                   str != nullptr) {
          line += *str;
        } else {
          line += to_json(*val);
        }
      }
      fmt::print(os, "{}\n", line);
    }
  }
}

}  // namespace vtile
