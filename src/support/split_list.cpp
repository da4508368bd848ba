/***
 * Name: archlink::support::SplitList
 * Purpose: Split "a,b,,c" into {"a", "b", "c"}.
 */
#include "archlink/support/text.h"

#include <cstddef>

namespace archlink::support {

auto SplitList(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> items;
  while (!text.empty()) {
    const std::size_t comma = text.find(',');
    const std::string_view item = text.substr(0, comma);
    if (!item.empty()) {
      items.emplace_back(item);
    }
    if (comma == std::string_view::npos) {
      break;
    }
    text.remove_prefix(comma + 1);
  }
  return items;
}

}  // namespace archlink::support
