#include "vtile/util.h"

#include <algorithm>

#include "zlib.h"

#include "utl/verify.h"

namespace vtile {

bool is_compressed(std::string_view data) {
  if (data.size() <= 2) {
    return false;
  }

  auto const b0 = static_cast<uint8_t>(data[0]);
  auto const b1 = static_cast<uint8_t>(data[1]);

  // zlib: deflate method, 32K window, header checksum
  auto const zlib = b0 == 0x78 && ((b0 << 8U) | b1) % 31 == 0;
  auto const gzip = b0 == 0x1F && b1 == 0x8B;
  return zlib || gzip;
}

std::string decompress(std::string_view input) {
  z_stream inflate_s;
  inflate_s.zalloc = Z_NULL;
  inflate_s.zfree = Z_NULL;
  inflate_s.opaque = Z_NULL;
  inflate_s.avail_in = 0;
  inflate_s.next_in = Z_NULL;

  // 32 + 15: detect zlib or gzip header, max window
  utl::verify(inflateInit2(&inflate_s, 32 + 15) == Z_OK,
              "decompress: inflateInit2 failed");

  inflate_s.next_in =
      reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
  inflate_s.avail_in = static_cast<uInt>(input.size());

  std::string output;
  while (true) {
    auto const existing = output.size();
    output.resize(existing + 2 * input.size() + 100);
    inflate_s.next_out = reinterpret_cast<Bytef*>(&output[existing]);
    inflate_s.avail_out = static_cast<uInt>(output.size() - existing);

    auto const ret = inflate(&inflate_s, Z_NO_FLUSH);
    output.resize(output.size() - inflate_s.avail_out);

    if (ret == Z_STREAM_END) {
      break;
    }

    if (ret != Z_OK || (inflate_s.avail_in == 0 && inflate_s.avail_out != 0)) {
      std::string const msg = inflate_s.msg != nullptr ? inflate_s.msg : "";
      inflateEnd(&inflate_s);
      throw utl::fail("decompress: inflate failed [ret={}, msg={}]", ret, msg);
    }
  }

  inflateEnd(&inflate_s);
  return output;
}

std::string compress_deflate(std::string const& input) {
  auto out_size = compressBound(input.size());
  std::string buffer(out_size, '\0');

  auto error = compress2(reinterpret_cast<uint8_t*>(&buffer[0]), &out_size,
                         reinterpret_cast<uint8_t const*>(input.data()),
                         input.size(), Z_BEST_COMPRESSION);
  utl::verify(error == 0, "compress_deflate failed");

  buffer.resize(out_size);
  return buffer;
}

std::string check_utf8(std::string_view s) {
  auto const in_range = [&](size_t const i, uint8_t const lo,
                            uint8_t const hi) {
    return i < s.size() && static_cast<uint8_t>(s[i]) >= lo &&
           static_cast<uint8_t>(s[i]) <= hi;
  };

  size_t i = 0;
  while (i < s.size()) {
    auto const c = static_cast<uint8_t>(s[i]);
    if (c < 0x80) {
      ++i;
      continue;
    }

    // sequence length and range of the second byte (RFC 3629, section 4):
    // no overlong forms, no surrogates, nothing above U+10FFFF
    size_t len = 0;
    uint8_t lo = 0x80;
    uint8_t hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
      len = 2;
    } else if (c == 0xE0) {
      len = 3;
      lo = 0xA0;
    } else if (c == 0xED) {
      len = 3;
      hi = 0x9F;
    } else if (c >= 0xE1 && c <= 0xEF) {
      len = 3;
    } else if (c == 0xF0) {
      len = 4;
      lo = 0x90;
    } else if (c >= 0xF1 && c <= 0xF3) {
      len = 4;
    } else if (c == 0xF4) {
      len = 4;
      hi = 0x8F;
    }

    auto valid = len != 0 && in_range(i + 1, lo, hi);
    for (size_t j = 2; valid && j < len; ++j) {
      valid = in_range(i + j, 0x80, 0xBF);
    }

    if (!valid) {
      std::string out = "not valid UTF-8 (";
      for (size_t j = 0; j < std::max(len, size_t{1}) && i + j < s.size();
           ++j) {
        if (j != 0) {
          out += " ";
        }
        out += fmt::format("0x{:02X}", static_cast<uint8_t>(s[i + j]));
      }
      out += ")";
      return out;
    }

    i += len;
  }

  return "";
}

}  // namespace vtile
