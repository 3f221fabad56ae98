#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "boost/filesystem.hpp"

#include "conf/configuration.h"
#include "conf/options_parser.h"

#include "utl/parser/mmap_reader.h"
#include "utl/verify.h"

#include "vtile/decode_error.h"
#include "vtile/mvt/decode_tile.h"
#include "vtile/mvt/print_tile.h"
#include "vtile/tile_url.h"
#include "vtile/util.h"

namespace vtile {

struct dump_settings : public conf::configuration {
  dump_settings() : conf::configuration("vtile-dump options", "") {
    param(tile_fname_, "tile", "/path/to/tile.mvt (raw, gzip or zlib)");
    param(max_features_, "max_features",
          "max number of sample features to print per layer");
    param(print_geometry_, "print_geometry",
          "print geometries for a limited number of features per layer");
    param(geometry_max_features_, "geometry_max_features",
          "max number of features per layer to print geometry for");
    param(geometry_max_coords_, "geometry_max_coords",
          "max number of coordinate elements per geometry nesting level");
    param(fields_, "fields",
          "property names to list for every feature (e.g. bearing shipname)");
    param(parallel_, "parallel", "decode layers on worker threads");
    param(url_, "url", "tile request url to print with the matched filter");
    param(matched_, "matched",
          "matched filter for --url: true, false or any (removes it)");
  }

  std::string tile_fname_;
  size_t max_features_{3};
  bool print_geometry_{false};
  size_t geometry_max_features_{5};
  size_t geometry_max_coords_{10};
  std::vector<std::string> fields_;
  bool parallel_{false};
  std::string url_;
  std::string matched_;
};

std::string read_tile_file(std::string const& fname) {
  utl::verify(boost::filesystem::exists(fname), "tile file not found: {}",
              fname);
  utl::mmap_reader mem{fname.c_str()};
  return std::string{mem.m_.ptr(), mem.m_.size()};
}

int run_vtile_dump(int argc, char const** argv) {
  dump_settings opt;

  try {
    conf::options_parser parser({&opt});
    parser.read_command_line_args(argc, argv, false);

    if (parser.help() || parser.version()) {
      std::cout << "vtile-dump\n\n";
      parser.print_help(std::cout);
      return 0;
    }

    parser.read_configuration_file(false);
    parser.print_used(std::cout);
  } catch (std::exception const& e) {
    std::cout << "options error: " << e.what() << "\n";
    return 1;
  }

  if (!opt.url_.empty()) {
    utl::verify(opt.matched_.empty() || opt.matched_ == "true" ||
                    opt.matched_ == "false" || opt.matched_ == "any",
                "invalid matched filter: {}", opt.matched_);
    std::cout << "request url: "
              << adjust_matched_filter(
                     opt.url_, opt.matched_.empty()
                                   ? std::nullopt
                                   : std::make_optional(opt.matched_))
              << "\n";
    if (opt.tile_fname_.empty()) {
      return 0;
    }
  }

  utl::verify(!opt.tile_fname_.empty(), "no tile file given");

  auto buf = read_tile_file(opt.tile_fname_);
  t_log("read {} ({})", opt.tile_fname_, printable_bytes{buf.size()});

  if (is_compressed(buf)) {
    buf = decompress(buf);
    t_log("decompressed to {}", printable_bytes{buf.size()});
  }

  decode_result decoded;
  try {
    scoped_timer t{"decode tile"};
    decoded = decode_tile(buf, decode_options{opt.parallel_, 0});
  } catch (decode_error const& e) {
    std::cerr << "decode error: " << e.what() << "\n";
    return 1;
  }

  for (auto const& w : decoded.warnings_) {
    t_log("warning: layer {} feature {} (offset {}): {}", w.layer_, w.feature_,
          w.offset_, w.msg_);
  }

  print_summary(std::cout, decoded.tile_, opt.max_features_);

  if (!opt.fields_.empty()) {
    print_fields(std::cout, decoded.tile_, opt.fields_);
  }

  if (opt.print_geometry_) {
    print_geometries(std::cout, decoded.tile_, opt.geometry_max_features_,
                     opt.geometry_max_coords_);
  }

  return 0;
}

}  // namespace vtile

int main(int argc, char const** argv) {
  try {
    return vtile::run_vtile_dump(argc, argv);
  } catch (std::exception const& e) {
    vtile::t_log("exception caught: {}", e.what());
    return 1;
  }
}
