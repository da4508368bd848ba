/***
 * Name: archlink::support (text)
 * Purpose: Small helpers for tokenizing line-oriented dump text.
 * Inputs: std::string_view inputs
 * Outputs: Token vectors and parsed integers; status booleans
 * Theory of Operation: Non-throwing; callers turn failures into their own errors.
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace archlink {
namespace support {

/*** SplitWords: Split on runs of ASCII whitespace; no empty tokens. */
std::vector<std::string> SplitWords(std::string_view text);

/*** SplitList: Split a comma-separated list; empty items are dropped. */
std::vector<std::string> SplitList(std::string_view text);

/*** ParseIntStrict: Parse an optionally signed base-10 int; fail on any extra character. */
bool ParseIntStrict(std::string_view text, int& out_val, std::string* err = nullptr);

}  // namespace support
}  // namespace archlink
