#pragma once

#include <cstdint>
#include <string>

namespace tables::util {

// Parses a non-negative decimal row id. Throws InvalidArgument naming
// `what` when the text is not a whole number or is negative.
int64_t ParseId(const std::string& text, const std::string& what);

// Parses a decimal int in [min, INT_MAX]. Values that do not fit an int
// are rejected rather than narrowed.
int ParseInt(const std::string& text, const std::string& what, int min = 0);

} // namespace tables::util
