#pragma once

#include "build/error.hpp"

#include <string>

namespace loom::cli {

void print_usage();
void print_version();

/// Prints a build error and its importer chain to stderr.
void report_error(const BuildError& error);

} // namespace loom::cli
