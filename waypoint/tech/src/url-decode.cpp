#include "waypoint/url-decode.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include "waypoint/char-hexadecimal-converter.hpp"

namespace waypoint::url {

char* DecodeInPlace(char* first, const char* last, bool strictInvalid) {
  char* out = first;
  for (; first < last; ++first) {
    const char ch = *first;
    if (ch != '%') {
      *out++ = ch;
      continue;
    }
    if (last - first < 3) {
      if (strictInvalid) {
        return nullptr;
      }
      // truncated escape: keep the remaining chars as they are
      while (first < last) {
        *out++ = *first++;
      }
      break;
    }
    const char c1 = first[1];
    const char c2 = first[2];
    const int v1 = from_hex_digit(c1);
    const int v2 = from_hex_digit(c2);
    if (v1 < 0 || v2 < 0) {
      if (strictInvalid) {
        return nullptr;
      }
      // only the '%' is consumed, the next chars may start a valid escape
      *out++ = '%';
      continue;
    }
    *out++ = static_cast<char>((v1 << 4) | v2);
    first += 2;
  }
  return out;
}

std::string DecodeBestEffort(std::string_view encoded) {
  std::string ret(encoded);
  if (encoded.find('%') == std::string_view::npos) {
    return ret;
  }
  char* newEnd = DecodeInPlace(ret.data(), ret.data() + ret.size(), /*strictInvalid*/ false);
  ret.resize(static_cast<std::size_t>(newEnd - ret.data()));
  return ret;
}

}  // namespace waypoint::url
