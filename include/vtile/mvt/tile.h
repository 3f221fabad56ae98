#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

#include "mpark/variant.hpp"

#include "vtile/mvt/geometry.h"
#include "vtile/mvt/tags.h"

namespace vtile {

constexpr uint32_t kDefaultLayerVersion = 1;
constexpr uint32_t kDefaultExtent = 4096;

using null_value = std::monostate;

// int64 and sint64 values both decode to int64_t
using value = mpark::variant<null_value, std::string, float, double, int64_t,
                             uint64_t, bool>;

struct property {
  property() = default;
  property(std::string key, value val)
      : key_{std::move(key)}, value_{std::move(val)} {}

  friend bool operator==(property const& lhs, property const& rhs) {
    return std::tie(lhs.key_, lhs.value_) == std::tie(rhs.key_, rhs.value_);
  }

  friend bool operator!=(property const& lhs, property const& rhs) {
    return !(lhs == rhs);
  }

  std::string key_;
  value value_;
};

// properties in tag order
using properties = std::vector<property>;

// nullptr if absent
inline value const* find_property(properties const& props,
                                  std::string_view key) {
  auto const it = std::find_if(begin(props), end(props),
                               [&](auto const& p) { return p.key_ == key; });
  return it == end(props) ? nullptr : &it->value_;
}

// a repeated key keeps the position of its first occurrence and the value
// of its last one
inline void set_property(properties& props, std::string const& key,
                         value const& val) {
  auto const it = std::find_if(begin(props), end(props),
                               [&](auto const& p) { return p.key_ == key; });
  if (it == end(props)) {
    props.emplace_back(key, val);
  } else {
    it->value_ = val;
  }
}

struct feature {
  std::optional<uint64_t> id_;
  tags::mvt::GeomType type_{tags::mvt::GeomType::UNKNOWN};
  geometry geometry_;
  properties properties_;
};

struct layer {
  std::string name_;
  uint32_t version_{kDefaultLayerVersion};
  uint32_t extent_{kDefaultExtent};
  std::vector<std::string> keys_;
  std::vector<value> values_;
  std::vector<feature> features_;
};

struct tile {
  std::vector<layer> layers_;
};

}  // namespace vtile
