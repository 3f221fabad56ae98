#include "vtile/mvt/decode_tile.h"

#include <algorithm>
#include <exception>
#include <iterator>
#include <thread>

#include "vtile/mvt/decode_layer.h"
#include "vtile/mvt/tags.h"
#include "vtile/pbf/wire_reader.h"
#include "vtile/util_parallel.h"

namespace pz = protozero;
namespace ttm = vtile::tags::mvt;

namespace vtile {

constexpr auto kLayerTag =
    static_cast<pz::pbf_tag_type>(ttm::Tile::repeated_Layer_layers);

// calls fn(sub, offset) for each layer message in buffer order
template <typename Fn>
void for_each_layer(std::string_view buf, Fn&& fn) {
  pbf::wire_reader reader{buf};
  while (!reader.at_end()) {
    auto const tag = reader.read_tag();
    if (tag.field_ == kLayerTag &&
        tag.type_ == pz::pbf_wire_type::length_delimited) {
      auto const sub = reader.read_length_delimited();
      fn(sub, reader.offset_of(sub));
    } else {
      reader.skip_field(tag.type_);
    }
  }
}

decode_result decode_sequential(std::string_view buf) {
  decode_result result;
  for_each_layer(buf, [&](std::string_view sub, size_t const offset) {
    result.tile_.layers_.emplace_back(
        decode_layer(sub, offset, result.warnings_));
  });
  return result;
}

struct layer_slot {
  std::string_view buf_;
  size_t offset_;

  layer layer_;
  std::vector<decode_warning> warnings_;
  std::exception_ptr error_;
};

decode_result decode_parallel(std::string_view buf, unsigned threads) {
  std::vector<layer_slot> slots;

  // layers before a broken top level field are still decoded: their
  // errors come first in buffer order
  std::exception_ptr scan_error;
  try {
    for_each_layer(buf, [&](std::string_view sub, size_t const offset) {
      slots.push_back(layer_slot{sub, offset, {}, {}, nullptr});
    });
  } catch (decode_error const&) {
    scan_error = std::current_exception();
  }

  queue_wrapper<size_t> queue;
  for (auto i = 0ULL; i < slots.size(); ++i) {
    queue.enqueue(static_cast<size_t>(i));
  }

  auto const num_workers = std::min(
      static_cast<size_t>(
          threads != 0 ? threads
                       : std::max(1U, std::thread::hardware_concurrency())),
      slots.size());

  std::vector<std::thread> workers;
  workers.reserve(num_workers);
  for (auto i = 0ULL; i < num_workers; ++i) {
    workers.emplace_back([&] {
      while (!queue.finished()) {
        size_t idx;
        if (!queue.dequeue(idx)) {
          continue;
        }

        auto& slot = slots[idx];
        try {
          slot.layer_ = decode_layer(slot.buf_, slot.offset_, slot.warnings_);
        } catch (std::exception const&) {
          slot.error_ = std::current_exception();
        }
        queue.finish();
      }
    });
  }
  std::for_each(begin(workers), end(workers), [](auto& t) { t.join(); });

  decode_result result;
  result.tile_.layers_.reserve(slots.size());
  for (auto& slot : slots) {
    if (slot.error_) {
      std::rethrow_exception(slot.error_);
    }
    result.tile_.layers_.emplace_back(std::move(slot.layer_));
    std::move(begin(slot.warnings_), end(slot.warnings_),
              std::back_inserter(result.warnings_));
  }

  if (scan_error) {
    std::rethrow_exception(scan_error);
  }

  return result;
}

decode_result decode_tile(std::string_view buf, decode_options const& opt) {
  return opt.parallel_ ? decode_parallel(buf, opt.threads_)
                       : decode_sequential(buf);
}

}  // namespace vtile
