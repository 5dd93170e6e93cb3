#include "util/string_parsing.hpp"
#include <cctype>
#include <stdexcept>

namespace peerdial {
namespace util {

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  auto value = SafeParseInt64(str, min, max);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  // Reject empty or whitespace-leading strings (stoll would skip the whitespace)
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  size_t pos = 0;
  long long value = 0;
  try {
    value = std::stoll(str, &pos);
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }

  // Check entire string was consumed
  if (pos != str.size()) {
    return std::nullopt;
  }

  if (value < min || value > max) {
    return std::nullopt;
  }

  return static_cast<int64_t>(value);
}

} // namespace util
} // namespace peerdial
