/***
 * Name: archlink::support::ParseIntStrict
 * Purpose: Parse a base-10 integer without throwing; fail on extra characters.
 * Inputs:
 *   - text: the literal, optionally signed
 * Outputs:
 *   - out_val: parsed integer on success
 *   - err: optional error message on failure
 * Theory of Operation: Manual digit parsing with range check.
 */
#include "archlink/support/text.h"

#include <cctype>
#include <limits>

namespace archlink::support {

auto ParseIntStrict(std::string_view text, int& out_val, std::string* err) -> bool {
  bool is_negative = false;
  if (!text.empty() && (text[0] == '+' || text[0] == '-')) {
    is_negative = (text[0] == '-');
    text.remove_prefix(1);
  }
  if (text.empty()) {
    if (err != nullptr) {
      *err = "invalid integer literal";
    }
    return false;
  }
  long long value = 0;
  for (const char ch : text) {
    if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
      if (err != nullptr) {
        *err = "invalid character in integer literal";
      }
      return false;
    }
    value = value * 10 + (ch - '0');
    if (value > std::numeric_limits<int>::max()) {
      if (err != nullptr) {
        *err = "integer overflow";
      }
      return false;
    }
  }
  out_val = static_cast<int>(is_negative ? -value : value);
  return true;
}

}  // namespace archlink::support
