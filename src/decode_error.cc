#include "vtile/decode_error.h"

namespace vtile {

char const* to_str(error_kind const kind) {
  switch (kind) {
    case error_kind::truncated_input: return "truncated_input";
    case error_kind::varint_overflow: return "varint_overflow";
    case error_kind::unknown_wire_type: return "unknown_wire_type";
    case error_kind::malformed_string: return "malformed_string";
    case error_kind::malformed_layer: return "malformed_layer";
    case error_kind::malformed_feature: return "malformed_feature";
    case error_kind::malformed_geometry: return "malformed_geometry";
  }
  return "unknown";
}

decode_error::decode_error(error_kind const kind, size_t const offset,
                           std::string msg)
    : std::runtime_error{fmt::format("{} at offset {}: {}", to_str(kind),
                                     offset, msg)},
      kind_{kind},
      offset_{offset},
      msg_{std::move(msg)} {}

}  // namespace vtile
