#pragma once

#include <time.h>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>

#include "fmt/core.h"
#include "fmt/ostream.h"

#include "utl/verify.h"

namespace vtile {

template <typename... Args>
inline void t_log(Args&&... args) {
  using clock = std::chrono::system_clock;
  auto const now = clock::to_time_t(clock::now());
  struct tm tmp;
#if _MSC_VER >= 1400
  gmtime_s(&tmp, &now);
#else
  gmtime_r(&now, &tmp);
#endif
  std::clog << std::put_time(&tmp, "%FT%TZ") << " | ";
  fmt::print(std::clog, std::forward<Args>(args)...);
  std::clog << std::endl;
}

// zlib (78 01 / 5E / 9C / DA) or gzip (1F 8B) header
bool is_compressed(std::string_view);

// inflate with automatic zlib / gzip header detection
std::string decompress(std::string_view);

std::string compress_deflate(std::string const&);

// returns an empty string if valid, a description of the first bad sequence
// otherwise
std::string check_utf8(std::string_view);

struct scoped_timer final {
  explicit scoped_timer(std::string label)
      : label_{std::move(label)}, start_{std::chrono::steady_clock::now()} {
    std::clog << "|> start: " << label_ << "\n";
  }

  ~scoped_timer() {
    using namespace std::chrono;

    auto const now = steady_clock::now();
    double dur = duration_cast<microseconds>(now - start_).count() / 1000.0;

    std::clog << "|> done: " << label_ << " (";
    if (dur < 1000) {
      std::clog << std::setw(6) << std::setprecision(4) << dur << "ms";
    } else {
      dur /= 1000;
      std::clog << std::setw(6) << std::setprecision(4) << dur << "s";
    }
    std::clog << ")" << std::endl;
  }

  std::string label_;
  std::chrono::time_point<std::chrono::steady_clock> start_;
};

struct printable_bytes {
  explicit printable_bytes(double n) : n_{n} {}
  explicit printable_bytes(uint64_t n) : n_{static_cast<double>(n)} {}
  double n_;
};

}  // namespace vtile

namespace fmt {

template <>
struct formatter<vtile::printable_bytes> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(vtile::printable_bytes const& bytes, FormatContext& ctx) const {
    auto const n = bytes.n_;
    auto const k = n / 1024;
    auto const m = n / (1024 * 1024);
    if (n < 1024) {
      return format_to(ctx.out(), "{:.0f}B", n);
    } else if (k < 1024) {
      return format_to(ctx.out(), "{:.2f}KB", k);
    } else {
      return format_to(ctx.out(), "{:.2f}MB", m);
    }
  }
};

}  // namespace fmt
