#include "util/string_parsing.hpp"
#include <algorithm>
#include <cctype>

namespace powledger {
namespace util {

bool IsValidHex(const std::string& str) {
  if (str.empty()) {
    return false;
  }

  for (char c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::optional<uint32_t> SafeParseHex32(const std::string& str) {
  std::string digits = str;
  if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
    digits = digits.substr(2);
  }

  if (digits.size() > 8 || !IsValidHex(digits)) {
    return std::nullopt;
  }

  uint32_t value = 0;
  for (char c : digits) {
    const int v = std::isdigit(static_cast<unsigned char>(c))
                      ? c - '0'
                      : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
    value = (value << 4) | static_cast<uint32_t>(v);
  }
  return value;
}

std::string FormatU128(uint128_t value) {
  if (value == 0) {
    return "0";
  }

  std::string out;
  while (value > 0) {
    out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
    value /= 10;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

} // namespace util
} // namespace powledger
