#include "vtile/pbf/wire_reader.h"

#include <cstring>

#include "boost/endian/conversion.hpp"

#include "protozero/exception.hpp"
#include "protozero/varint.hpp"

#include "vtile/decode_error.h"

namespace pz = protozero;

namespace vtile::pbf {

constexpr auto kMaxFieldNumber = (1U << 29U) - 1;

uint64_t wire_reader::read_varint() {
  auto const start = offset();
  auto const* begin = buf_.data() + pos_;
  auto const* const end = buf_.data() + buf_.size();
  try {
    auto const val = pz::decode_varint(&begin, end);
    pos_ = static_cast<size_t>(begin - buf_.data());
    return val;
  } catch (pz::end_of_buffer_exception const&) {
    throw_decode_error(error_kind::truncated_input, start,
                       "buffer ends inside varint");
  } catch (pz::varint_too_long_exception const&) {
    throw_decode_error(error_kind::varint_overflow, start,
                       "varint longer than 10 bytes");
  }
}

int64_t wire_reader::read_zigzag() {
  return pz::decode_zigzag64(read_varint());
}

field_tag wire_reader::read_tag() {
  auto const start = offset();
  auto const val = read_varint();

  auto const field = val >> 3U;
  if (field == 0 || field > kMaxFieldNumber) {
    throw_decode_error(error_kind::unknown_wire_type, start,
                       "invalid field number {}", field);
  }

  auto const type = static_cast<pz::pbf_wire_type>(val & 0x7U);
  switch (type) {
    case pz::pbf_wire_type::varint:
    case pz::pbf_wire_type::fixed64:
    case pz::pbf_wire_type::length_delimited:
    case pz::pbf_wire_type::fixed32:
      return field_tag{static_cast<uint32_t>(field), type};
    default:
      throw_decode_error(error_kind::unknown_wire_type, start,
                         "wire type {} (field {})", val & 0x7U, field);
  }
}

std::string_view wire_reader::read_length_delimited() {
  auto const start = offset();
  auto const len = read_varint();
  if (len > remaining()) {
    throw_decode_error(error_kind::truncated_input, start,
                       "length {} exceeds remaining {} bytes", len,
                       remaining());
  }

  auto const sub = buf_.substr(pos_, static_cast<size_t>(len));
  pos_ += sub.size();
  return sub;
}

uint32_t wire_reader::read_fixed32() {
  if (remaining() < sizeof(uint32_t)) {
    throw_decode_error(error_kind::truncated_input, offset(),
                       "fixed32 needs 4 bytes, {} remaining", remaining());
  }

  uint32_t val;
  std::memcpy(&val, buf_.data() + pos_, sizeof(val));
  pos_ += sizeof(val);
  return boost::endian::little_to_native(val);
}

uint64_t wire_reader::read_fixed64() {
  if (remaining() < sizeof(uint64_t)) {
    throw_decode_error(error_kind::truncated_input, offset(),
                       "fixed64 needs 8 bytes, {} remaining", remaining());
  }

  uint64_t val;
  std::memcpy(&val, buf_.data() + pos_, sizeof(val));
  pos_ += sizeof(val);
  return boost::endian::little_to_native(val);
}

void wire_reader::skip_field(pz::pbf_wire_type const type) {
  switch (type) {
    case pz::pbf_wire_type::varint: read_varint(); break;
    case pz::pbf_wire_type::fixed64: read_fixed64(); break;
    case pz::pbf_wire_type::length_delimited: read_length_delimited(); break;
    case pz::pbf_wire_type::fixed32: read_fixed32(); break;
    default:
      throw_decode_error(error_kind::unknown_wire_type, offset(),
                         "cannot skip wire type {}",
                         static_cast<uint32_t>(type));
  }
}

std::vector<uint64_t> read_packed_varints(std::string_view buf,
                                          size_t const base_offset) {
  std::vector<uint64_t> out;
  wire_reader reader{buf, base_offset};
  while (!reader.at_end()) {
    out.push_back(reader.read_varint());
  }
  return out;
}

}  // namespace vtile::pbf
