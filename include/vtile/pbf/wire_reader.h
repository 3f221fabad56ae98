#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "protozero/types.hpp"

namespace vtile::pbf {

struct field_tag {
  uint32_t field_;
  protozero::pbf_wire_type type_;
};

// Cursor over a protobuf encoded buffer. Offsets reported in errors are
// base_offset + position within buf, i.e. absolute in the enclosing buffer.
struct wire_reader {
  explicit wire_reader(std::string_view buf, size_t base_offset = 0)
      : buf_{buf}, base_offset_{base_offset} {}

  uint64_t read_varint();
  int64_t read_zigzag();
  field_tag read_tag();

  // view into buf, no copy
  std::string_view read_length_delimited();

  uint32_t read_fixed32();
  uint64_t read_fixed64();

  void skip_field(protozero::pbf_wire_type);

  bool at_end() const { return pos_ == buf_.size(); }
  size_t remaining() const { return buf_.size() - pos_; }
  size_t offset() const { return base_offset_ + pos_; }

  // absolute offset of a view previously returned by read_length_delimited
  size_t offset_of(std::string_view sub) const {
    return base_offset_ + static_cast<size_t>(sub.data() - buf_.data());
  }

  std::string_view buf_;
  size_t base_offset_;
  size_t pos_{0};
};

// elements of a packed repeated varint field
std::vector<uint64_t> read_packed_varints(std::string_view buf,
                                          size_t base_offset);

}  // namespace vtile::pbf
