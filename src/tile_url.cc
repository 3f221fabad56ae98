#include "vtile/tile_url.h"

#include <algorithm>

#include "fmt/core.h"

namespace vtile {

namespace {

constexpr auto kMatchedFilterKey = "filters[0]";

int hex_value(char const c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  } else if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  } else if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

// malformed escapes are kept verbatim
std::string unquote_plus(std::string_view in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '+') {
      out.push_back(' ');
    } else if (in[i] == '%' && i + 2 < in.size() &&
               hex_value(in[i + 1]) != -1 && hex_value(in[i + 2]) != -1) {
      out.push_back(
          static_cast<char>(hex_value(in[i + 1]) * 16 + hex_value(in[i + 2])));
      i += 2;
    } else {
      out.push_back(in[i]);
    }
  }
  return out;
}

void quote_plus(std::string& out, std::string_view in) {
  for (auto const c : in) {
    auto const u = static_cast<unsigned char>(c);
    if ((u >= '0' && u <= '9') || (u >= 'a' && u <= 'z') ||
        (u >= 'A' && u <= 'Z') || u == '-' || u == '.' || u == '_' ||
        u == '~') {
      out.push_back(c);
    } else if (u == ' ') {
      out.push_back('+');
    } else {
      out.append(fmt::format("%{:02X}", u));
    }
  }
}

}  // namespace

query_items parse_query(std::string_view query) {
  query_items items;
  while (!query.empty()) {
    auto const amp = query.find('&');
    auto const pair = query.substr(0, amp);
    query = amp == std::string_view::npos ? std::string_view{}
                                          : query.substr(amp + 1);
    if (pair.empty()) {
      continue;
    }

    auto const eq = pair.find('=');
    if (eq == std::string_view::npos) {
      items.emplace_back(unquote_plus(pair), std::string{});
    } else {
      items.emplace_back(unquote_plus(pair.substr(0, eq)),
                         unquote_plus(pair.substr(eq + 1)));
    }
  }
  return items;
}

std::string encode_query(query_items const& items) {
  std::string out;
  for (auto const& [key, val] : items) {
    if (!out.empty()) {
      out.push_back('&');
    }
    quote_plus(out, key);
    out.push_back('=');
    quote_plus(out, val);
  }
  return out;
}

std::string adjust_matched_filter(std::string const& url,
                                  std::optional<std::string> const& choice) {
  if (!choice.has_value()) {
    return url;
  }

  std::string_view rest{url};
  std::string_view fragment;
  if (auto const hash = rest.find('#'); hash != std::string_view::npos) {
    fragment = rest.substr(hash + 1);
    rest = rest.substr(0, hash);
  }
  std::string_view query;
  if (auto const qm = rest.find('?'); qm != std::string_view::npos) {
    query = rest.substr(qm + 1);
    rest = rest.substr(0, qm);
  }

  auto items = parse_query(query);
  items.erase(std::remove_if(begin(items), end(items),
                             [](auto const& item) {
                               return item.first == kMatchedFilterKey;
                             }),
              end(items));
  if (*choice != "any") {
    items.emplace_back(kMatchedFilterKey,
                       fmt::format("matched IN ('{}')", *choice));
  }

  std::string out{rest};
  if (auto const encoded = encode_query(items); !encoded.empty()) {
    out.append("?");
    out.append(encoded);
  }
  if (!fragment.empty()) {
    out.append("#");
    out.append(fragment);
  }
  return out;
}

}  // namespace vtile
