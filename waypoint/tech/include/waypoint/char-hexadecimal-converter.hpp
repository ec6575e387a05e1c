#pragma once

namespace waypoint {

/// Decode a single hexadecimal digit. Returns -1 if invalid.
/// Examples:
///  '7' -> 7
///  'c' -> 12
///  'C' -> 12
constexpr int from_hex_digit(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  return -1;
}

}  // namespace waypoint
