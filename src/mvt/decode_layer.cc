#include "vtile/mvt/decode_layer.h"

#include <limits>
#include <string>

#include "vtile/decode_error.h"
#include "vtile/mvt/decode_geometry.h"
#include "vtile/mvt/decode_value.h"
#include "vtile/mvt/tags.h"
#include "vtile/pbf/wire_reader.h"
#include "vtile/util.h"

namespace pz = protozero;
namespace ttm = vtile::tags::mvt;

namespace vtile {

// tags and geometry stay raw until the whole layer (keys, values, name)
// has been read
struct pending_feature {
  std::vector<uint64_t> tags_;
  size_t tags_offset_{0};

  std::vector<uint32_t> geometry_;
  size_t geometry_offset_{0};

  feature feature_;
};

// packed (length delimited) or a single unpacked element
void read_repeated_varint(pbf::wire_reader& reader, pz::pbf_wire_type type,
                          std::vector<uint64_t>& out) {
  switch (type) {
    case pz::pbf_wire_type::length_delimited: {
      auto const sub = reader.read_length_delimited();
      auto const vals = pbf::read_packed_varints(sub, reader.offset_of(sub));
      out.insert(end(out), begin(vals), end(vals));
    } break;
    case pz::pbf_wire_type::varint: out.push_back(reader.read_varint()); break;
    default: reader.skip_field(type);
  }
}

pending_feature read_feature(std::string_view buf, size_t const base_offset) {
  pending_feature f;
  std::vector<uint64_t> geometry;

  pbf::wire_reader reader{buf, base_offset};
  while (!reader.at_end()) {
    auto const field_offset = reader.offset();
    auto const tag = reader.read_tag();
    switch (static_cast<ttm::Feature>(tag.field_)) {
      case ttm::Feature::optional_uint64_id:
        if (tag.type_ != pz::pbf_wire_type::varint) {
          reader.skip_field(tag.type_);
          break;
        }
        f.feature_.id_ = reader.read_varint();
        break;

      case ttm::Feature::packed_uint32_tags:
        if (f.tags_.empty()) {
          f.tags_offset_ = field_offset;
        }
        read_repeated_varint(reader, tag.type_, f.tags_);
        break;

      case ttm::Feature::optional_GeomType_type: {
        if (tag.type_ != pz::pbf_wire_type::varint) {
          reader.skip_field(tag.type_);
          break;
        }
        auto const type = reader.read_varint();
        f.feature_.type_ = type <= static_cast<uint64_t>(ttm::GeomType::POLYGON)
                               ? static_cast<ttm::GeomType>(type)
                               : ttm::GeomType::UNKNOWN;
      } break;

      case ttm::Feature::packed_uint32_geometry:
        if (geometry.empty()) {
          f.geometry_offset_ = field_offset;
        }
        read_repeated_varint(reader, tag.type_, geometry);
        break;

      default: reader.skip_field(tag.type_);
    }
  }

  f.geometry_.reserve(geometry.size());
  for (auto const val : geometry) {
    if (val > std::numeric_limits<uint32_t>::max()) {
      throw_decode_error(error_kind::malformed_geometry, f.geometry_offset_,
                         "command stream value {} exceeds uint32", val);
    }
    f.geometry_.push_back(static_cast<uint32_t>(val));
  }

  return f;
}

feature resolve_feature(pending_feature& f, layer const& l, size_t const idx,
                        std::vector<decode_warning>& warnings) {
  if (f.tags_.size() % 2 != 0) {
    throw_decode_error(error_kind::malformed_feature, f.tags_offset_,
                       "layer {}: feature {} has odd number of tags ({})",
                       l.name_, idx, f.tags_.size());
  }

  for (auto i = 0u; i < f.tags_.size(); i += 2) {
    auto const key_idx = f.tags_[i];
    auto const value_idx = f.tags_[i + 1];
    if (key_idx >= l.keys_.size()) {
      throw_decode_error(error_kind::malformed_feature, f.tags_offset_,
                         "layer {}: feature {} key index {} out of bounds "
                         "(keys: {})",
                         l.name_, idx, key_idx, l.keys_.size());
    }
    if (value_idx >= l.values_.size()) {
      throw_decode_error(error_kind::malformed_feature, f.tags_offset_,
                         "layer {}: feature {} value index {} out of bounds "
                         "(values: {})",
                         l.name_, idx, value_idx, l.values_.size());
    }
    set_property(f.feature_.properties_, l.keys_[key_idx],
                 l.values_[value_idx]);
  }

  std::vector<std::string> geometry_warnings;
  f.feature_.geometry_ = decode_geometry(f.feature_.type_, f.geometry_,
                                         f.geometry_offset_, geometry_warnings);
  for (auto& msg : geometry_warnings) {
    warnings.push_back(
        decode_warning{l.name_, idx, f.geometry_offset_, std::move(msg)});
  }

  return std::move(f.feature_);
}

std::string read_text(pbf::wire_reader& reader, char const* what) {
  auto const str = reader.read_length_delimited();
  if (auto const err = check_utf8(str); !err.empty()) {
    throw_decode_error(error_kind::malformed_string, reader.offset_of(str),
                       "{} {}", what, err);
  }
  return std::string{str};
}

layer decode_layer(std::string_view buf, size_t const base_offset,
                   std::vector<decode_warning>& warnings) {
  layer l;
  std::vector<pending_feature> pending;

  pbf::wire_reader reader{buf, base_offset};
  while (!reader.at_end()) {
    auto const tag = reader.read_tag();
    auto const expect = [&](pz::pbf_wire_type type) {
      if (tag.type_ == type) {
        return true;
      }
      reader.skip_field(tag.type_);
      return false;
    };

    switch (static_cast<ttm::Layer>(tag.field_)) {
      case ttm::Layer::required_uint32_version:
        if (expect(pz::pbf_wire_type::varint)) {
          l.version_ = static_cast<uint32_t>(reader.read_varint());
        }
        break;

      case ttm::Layer::required_string_name:
        if (expect(pz::pbf_wire_type::length_delimited)) {
          l.name_ = read_text(reader, "layer name");
        }
        break;

      case ttm::Layer::repeated_Feature_features:
        if (expect(pz::pbf_wire_type::length_delimited)) {
          auto const sub = reader.read_length_delimited();
          pending.emplace_back(read_feature(sub, reader.offset_of(sub)));
        }
        break;

      case ttm::Layer::repeated_string_keys:
        if (expect(pz::pbf_wire_type::length_delimited)) {
          l.keys_.emplace_back(read_text(reader, "key"));
        }
        break;

      case ttm::Layer::repeated_Value_values:
        if (expect(pz::pbf_wire_type::length_delimited)) {
          auto const sub = reader.read_length_delimited();
          l.values_.emplace_back(decode_value(sub, reader.offset_of(sub)));
        }
        break;

      case ttm::Layer::optional_uint32_extent:
        if (expect(pz::pbf_wire_type::varint)) {
          l.extent_ = static_cast<uint32_t>(reader.read_varint());
        }
        break;

      default: reader.skip_field(tag.type_);
    }
  }

  if (l.name_.empty()) {
    throw_decode_error(error_kind::malformed_layer, base_offset,
                       "layer without name ({} features)", pending.size());
  }

  l.features_.reserve(pending.size());
  for (auto i = 0u; i < pending.size(); ++i) {
    l.features_.emplace_back(resolve_feature(pending[i], l, i, warnings));
  }

  return l;
}

}  // namespace vtile
