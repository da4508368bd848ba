/***
 * Name: archlink::support::SplitWords
 * Purpose: Split a line into whitespace-separated tokens.
 */
#include "archlink/support/text.h"

#include <cctype>
#include <cstddef>

namespace archlink::support {

auto SplitWords(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> words;
  std::size_t index = 0;
  while (index < text.size()) {
    while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) != 0) {
      ++index;
    }
    const std::size_t start = index;
    while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) == 0) {
      ++index;
    }
    if (index > start) {
      words.emplace_back(text.substr(start, index - start));
    }
  }
  return words;
}

}  // namespace archlink::support
