#pragma once

#include <string>
#include <string_view>

namespace waypoint::url {

// Decodes within the provided char range, compacting percent-encoded sequences.
// '+' is left untouched: it only means space in query strings, never in path segments.
// If strictInvalid is true, returns nullptr on invalid encoding (truncated % or non-hex digits)
// leaving the range in an unspecified partially modified state.
// Otherwise invalid escapes are copied literally.
// Returns a pointer to the new logical end of the decoded sequence.
char* DecodeInPlace(char* first, const char* last, bool strictInvalid = true);

// Returns a percent-decoded copy of 'encoded', keeping invalid escapes literally.
std::string DecodeBestEffort(std::string_view encoded);

}  // namespace waypoint::url
