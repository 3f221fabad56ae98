#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

#include "fmt/core.h"

namespace vtile {

enum class error_kind {
  truncated_input,
  varint_overflow,
  unknown_wire_type,
  malformed_string,
  malformed_layer,
  malformed_feature,
  malformed_geometry
};

char const* to_str(error_kind);

// Aborts the whole tile decode. offset is absolute in the tile buffer.
struct decode_error : public std::runtime_error {
  decode_error(error_kind kind, size_t offset, std::string msg);

  error_kind kind() const { return kind_; }
  size_t offset() const { return offset_; }
  std::string const& message() const { return msg_; }

  error_kind kind_;
  size_t offset_;
  std::string msg_;
};

template <typename... Args>
[[noreturn]] void throw_decode_error(error_kind kind, size_t offset,
                                     fmt::format_string<Args...> fmt_str,
                                     Args&&... args) {
  throw decode_error{kind, offset,
                     fmt::format(fmt_str, std::forward<Args>(args)...)};
}

// Non-fatal, reported next to the decoded tile.
struct decode_warning {
  std::string layer_;
  size_t feature_;
  size_t offset_;
  std::string msg_;
};

}  // namespace vtile
