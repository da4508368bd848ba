/**
 * @file
 * @brief Declarations for archlink CLI argument parsing helpers.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "archlink/cli/ColorMode.h"
#include "archlink/cli/Options.h"
#include "archlink/model/CodeUnit.h"

namespace archlink::cli::detail {

/** Return true if `arg` exactly matches the `flag`. */
bool isFlag(std::string_view arg, std::string_view flag);

/** Parse `--color=<value>`; throws ConfigError on anything but always|never|auto. */
ColorMode parseColorValue(std::string_view value);

/** Parse a job count (0 allowed); throws ConfigError when not a non-negative integer. */
unsigned parseJobsValue(std::string_view value);

/** Parse `Class#name#descriptor`; throws ConfigError when malformed. */
model::CodeUnit parseCallerValue(std::string_view value);

/** Collect remaining argv items as input paths starting at index. */
void collectRemainingAsInputs(std::size_t startIndex, int argc, char** argv, Options& out);

/** Detect unknown option-like arguments beginning with '-' that aren't supported. */
bool isUnknownOptionArg(std::string_view arg);

/** Handle boolean, flag-only options like -h, --metrics, --quiet. */
bool applySimpleBoolFlags(std::string_view arg, Options& out);

/** Handle `--key=value` style options (jobs, classpath, color, caller). */
bool applyPrefixedOptions(std::string_view arg, Options& out);

/** Handle `-j <N>` by consuming the next argv item. */
bool handleJobsFlag(int& idx, int argc, char** argv, Options& out);

} // namespace archlink::cli::detail
