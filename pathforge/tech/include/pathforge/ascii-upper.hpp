#pragma once

#include <algorithm>
#include <string>
#include <string_view>

namespace pathforge {

constexpr unsigned char toupper(unsigned char ch) {
  if (ch >= 'a' && ch <= 'z') {
    ch &= 0xDF;  // clear lowercase bit
  }
  return ch;
}

constexpr char toupper(char ch) { return static_cast<char>(toupper(static_cast<unsigned char>(ch))); }

// Returns an ASCII uppercase copy of 'str'. Used to canonicalize HTTP verbs.
inline std::string ToUpperAscii(std::string_view str) {
  std::string ret(str);
  std::ranges::transform(ret, ret.begin(), [](char ch) { return toupper(ch); });
  return ret;
}

constexpr bool IsUpperAscii(std::string_view str) {
  return std::ranges::none_of(str, [](char ch) { return ch >= 'a' && ch <= 'z'; });
}

}  // namespace pathforge
