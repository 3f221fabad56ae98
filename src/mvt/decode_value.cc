#include "vtile/mvt/decode_value.h"

#include <cstring>

#include "vtile/decode_error.h"
#include "vtile/mvt/tags.h"
#include "vtile/pbf/wire_reader.h"
#include "vtile/util.h"

namespace pz = protozero;
namespace ttm = vtile::tags::mvt;

namespace vtile {

template <typename To, typename From>
To bit_cast(From const from) {
  static_assert(sizeof(To) == sizeof(From));
  To to;
  std::memcpy(&to, &from, sizeof(To));
  return to;
}

value decode_value(std::string_view buf, size_t const base_offset) {
  value result = null_value{};

  pbf::wire_reader reader{buf, base_offset};
  while (!reader.at_end()) {
    auto const tag = reader.read_tag();
    auto const is = [&](ttm::Value field, pz::pbf_wire_type type) {
      return tag.field_ == static_cast<pz::pbf_tag_type>(field) &&
             tag.type_ == type;
    };

    if (is(ttm::Value::optional_string_string_value,
           pz::pbf_wire_type::length_delimited)) {
      auto const str = reader.read_length_delimited();
      if (auto const err = check_utf8(str); !err.empty()) {
        throw_decode_error(error_kind::malformed_string, reader.offset_of(str),
                           "string value {}", err);
      }
      result = std::string{str};
    } else if (is(ttm::Value::optional_float_float_value,
                  pz::pbf_wire_type::fixed32)) {
      result = bit_cast<float>(reader.read_fixed32());
    } else if (is(ttm::Value::optional_double_double_value,
                  pz::pbf_wire_type::fixed64)) {
      result = bit_cast<double>(reader.read_fixed64());
    } else if (is(ttm::Value::optional_int64_int_value,
                  pz::pbf_wire_type::varint)) {
      result = static_cast<int64_t>(reader.read_varint());
    } else if (is(ttm::Value::optional_uint64_uint_value,
                  pz::pbf_wire_type::varint)) {
      result = reader.read_varint();
    } else if (is(ttm::Value::optional_sint64_sint_value,
                  pz::pbf_wire_type::varint)) {
      result = reader.read_zigzag();
    } else if (is(ttm::Value::optional_bool_bool_value,
                  pz::pbf_wire_type::varint)) {
      result = reader.read_varint() != 0;
    } else {
      reader.skip_field(tag.type_);
    }
  }

  return result;
}

}  // namespace vtile
