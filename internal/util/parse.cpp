#include "internal/util/parse.hpp"

#include <climits>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace tables::util {
namespace {

long long ParseWhole(const std::string& text, const std::string& what) {
  std::size_t consumed = 0;
  long long   value    = 0;
  try {
    value = std::stoll(text, &consumed);
  } catch (const std::invalid_argument&) {
    consumed = 0;
  } catch (const std::out_of_range&) {
    throw InvalidArgument(what + " out of range: '" + text + "'");
  }
  if (text.empty() || consumed != text.size()) {
    throw InvalidArgument("invalid " + what + ": '" + text + "'");
  }
  return value;
}

} // namespace

int64_t ParseId(const std::string& text, const std::string& what) {
  auto value = ParseWhole(text, what);
  if (value < 0) {
    throw InvalidArgument("invalid " + what + ": '" + text + "'");
  }
  return static_cast<int64_t>(value);
}

int ParseInt(const std::string& text, const std::string& what, int min) {
  auto value = ParseWhole(text, what);
  if (value < min || value > INT_MAX) {
    throw InvalidArgument(what + " must be between " + std::to_string(min) + " and " + std::to_string(INT_MAX) + ", got '" + text + "'");
  }
  return static_cast<int>(value);
}

} // namespace tables::util
