#pragma once

#include "vtile/mvt/geometry.h"

namespace vtile {

struct delta_encoder {
  explicit delta_encoder(coord_t init) : curr_(init) {}

  int64_t encode(coord_t val) {
    auto delta = val - curr_;
    curr_ = val;
    return delta;
  }

  coord_t curr_;
};

struct delta_decoder {
  explicit delta_decoder(coord_t init) : curr_(init) {}

  coord_t decode(int64_t val) {
    curr_ += val;
    return curr_;
  }

  coord_t curr_;
};

}  // namespace vtile
