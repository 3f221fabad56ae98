#include "vtile/mvt/decode_geometry.h"

#include "fmt/core.h"

#include "protozero/varint.hpp"

#include "vtile/decode_error.h"
#include "vtile/mvt/algo/delta.h"
#include "vtile/mvt/algo/signed_area.h"

namespace pz = protozero;
namespace ttm = vtile::tags::mvt;

namespace vtile {

struct command {
  uint32_t id_;
  uint32_t count_;
  size_t pos_;
};

struct command_reader {
  command_reader(std::vector<uint32_t> const& stream, size_t offset)
      : stream_{stream}, offset_{offset} {}

  template <typename... Args>
  void verify(bool cond, fmt::format_string<Args...> fmt_str,
              Args&&... args) const {
    if (!cond) {
      throw_decode_error(error_kind::malformed_geometry, offset_, fmt_str,
                         std::forward<Args>(args)...);
    }
  }

  bool has_next() const { return pos_ != stream_.size(); }

  command next_command() {
    auto const pos = pos_;
    auto const val = stream_[pos_++];
    return {val & 0x7U, val >> 3U, pos};
  }

  // all parameters of a MoveTo / LineTo must be present
  void expect_points(command const& cmd) const {
    verify(cmd.count_ != 0, "command {} at {} has count 0", cmd.id_, cmd.pos_);
    auto const needed = 2ULL * cmd.count_;
    verify(stream_.size() - pos_ >= needed,
           "command {} at {} needs {} parameters, {} remaining", cmd.id_,
           cmd.pos_, needed, stream_.size() - pos_);
  }

  xy next_point() {
    auto const dx = pz::decode_zigzag32(stream_[pos_++]);
    auto const dy = pz::decode_zigzag32(stream_[pos_++]);
    return xy{x_dec_.decode(dx), y_dec_.decode(dy)};
  }

  std::vector<uint32_t> const& stream_;
  size_t offset_;
  size_t pos_{0};

  delta_decoder x_dec_{0};
  delta_decoder y_dec_{0};
};

point_geometry decode_points(command_reader& reader) {
  point_geometry points;
  while (reader.has_next()) {
    auto const cmd = reader.next_command();
    reader.verify(cmd.id_ == ttm::MOVE_TO,
                  "point geometry: unexpected command {} at {}", cmd.id_,
                  cmd.pos_);
    reader.expect_points(cmd);
    for (auto i = 0u; i < cmd.count_; ++i) {
      points.push_back(reader.next_point());
    }
  }
  return points;
}

linestring_geometry decode_linestrings(command_reader& reader) {
  linestring_geometry lines;
  auto const finish_line = [&] {
    reader.verify(lines.empty() || lines.back().size() >= 2,
                  "linestring {} has {} point(s)", lines.size() - 1,
                  lines.empty() ? 0 : lines.back().size());
  };

  while (reader.has_next()) {
    auto const cmd = reader.next_command();
    switch (cmd.id_) {
      case ttm::MOVE_TO:
        reader.verify(cmd.count_ == 1, "linestring: MoveTo count {} at {}",
                      cmd.count_, cmd.pos_);
        reader.expect_points(cmd);
        finish_line();
        lines.emplace_back();
        lines.back().push_back(reader.next_point());
        break;

      case ttm::LINE_TO:
        reader.verify(!lines.empty(), "linestring: LineTo at {} before MoveTo",
                      cmd.pos_);
        reader.expect_points(cmd);
        for (auto i = 0u; i < cmd.count_; ++i) {
          lines.back().push_back(reader.next_point());
        }
        break;

      default:
        reader.verify(false, "linestring: unexpected command {} at {}",
                      cmd.id_, cmd.pos_);
    }
  }
  finish_line();

  return lines;
}

struct ring_classifier {
  enum class state { awaiting_exterior, accumulating_holes };

  void add(ring r) {
    auto const idx = ring_count_++;
    if (signed_area(r) > 0) {
      polygons_.emplace_back();
      polygons_.back().outer() = std::move(r);
      state_ = state::accumulating_holes;
      return;
    }

    switch (state_) {
      case state::awaiting_exterior:
        warnings_.emplace_back(
            fmt::format("interior ring {} without exterior ring", idx));
        polygons_.emplace_back();
        polygons_.back().inners().push_back(std::move(r));
        state_ = state::accumulating_holes;
        break;

      case state::accumulating_holes:
        polygons_.back().inners().push_back(std::move(r));
        break;
    }
  }

  std::vector<std::string>& warnings_;
  polygon_geometry polygons_;
  state state_{state::awaiting_exterior};
  size_t ring_count_{0};
};

polygon_geometry decode_polygons(command_reader& reader,
                                 std::vector<std::string>& warnings) {
  ring_classifier classifier{warnings, {}};
  ring current;
  auto open = false;

  while (reader.has_next()) {
    auto const cmd = reader.next_command();
    switch (cmd.id_) {
      case ttm::MOVE_TO:
        reader.verify(cmd.count_ == 1, "polygon: MoveTo count {} at {}",
                      cmd.count_, cmd.pos_);
        reader.verify(!open, "polygon: MoveTo at {} inside unclosed ring",
                      cmd.pos_);
        reader.expect_points(cmd);
        current.push_back(reader.next_point());
        open = true;
        break;

      case ttm::LINE_TO:
        reader.verify(open, "polygon: LineTo at {} outside ring", cmd.pos_);
        reader.expect_points(cmd);
        for (auto i = 0u; i < cmd.count_; ++i) {
          current.push_back(reader.next_point());
        }
        break;

      case ttm::CLOSE_PATH:
        reader.verify(cmd.count_ == 1, "polygon: ClosePath count {} at {}",
                      cmd.count_, cmd.pos_);
        reader.verify(open, "polygon: ClosePath at {} outside ring", cmd.pos_);
        reader.verify(current.size() >= 3,
                      "polygon: ring closed at {} has {} point(s)", cmd.pos_,
                      current.size());
        current.push_back(current.front());
        classifier.add(std::move(current));
        current = ring{};
        open = false;
        break;

      default:
        reader.verify(false, "polygon: unexpected command {} at {}", cmd.id_,
                      cmd.pos_);
    }
  }
  reader.verify(!open, "polygon: last ring not closed");

  return std::move(classifier.polygons_);
}

geometry decode_geometry(ttm::GeomType const type,
                         std::vector<uint32_t> const& stream,
                         size_t const offset,
                         std::vector<std::string>& warnings) {
  if (stream.empty()) {
    return null_geometry{};
  }

  command_reader reader{stream, offset};
  switch (type) {
    case ttm::GeomType::POINT: return decode_points(reader);
    case ttm::GeomType::LINESTRING: return decode_linestrings(reader);
    case ttm::GeomType::POLYGON: return decode_polygons(reader, warnings);
    default: return null_geometry{};
  }
}

}  // namespace vtile
