#pragma once

#include <string_view>
#include <vector>

#include "vtile/decode_error.h"
#include "vtile/mvt/tile.h"

namespace vtile {

struct decode_options {
  // decode layers on worker threads; the result is identical to the
  // sequential decode (layers in buffer order, same first error)
  bool parallel_{false};

  // 0: std::thread::hardware_concurrency()
  unsigned threads_{0};
};

struct decode_result {
  tile tile_;
  std::vector<decode_warning> warnings_;
};

// Decodes an uncompressed tile. Throws decode_error; no partial results.
// The returned tile does not reference buf.
decode_result decode_tile(std::string_view buf,
                          decode_options const& opt = decode_options{});

}  // namespace vtile
