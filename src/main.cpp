/***
 * Name: archlink::main
 * Purpose: CLI entry point for the archlink resolver.
 * Inputs:
 *   - argv
 * Outputs:
 *   - Exit status
 * Theory of Operation:
 *   Parse args then invoke driver::Run.
 */
#include "archlink/cli/ParseArgs.h"
#include "archlink/cli/Usage.h"
#include "archlink/driver/app.h"

#include <exception>
#include <iostream>

int main(const int argc, char** argv) {
  try {
    archlink::cli::Options opts;
    if (!archlink::cli::ParseArgs(argc, argv, opts)) {
      std::cerr << "archlink: argument parse error\n";
      std::cerr << archlink::cli::Usage();
      return 2;
    }
    if (opts.showHelp) {
      std::cout << archlink::cli::Usage();
      return 0;
    }
    return archlink::driver::Run(opts);
  } catch (const std::exception& e) {
    std::cerr << "archlink: unhandled exception: " << e.what() << "\n";
    return 1;
  }
}
