#include "utils.hpp"

#include "common.hpp"

#include <iostream>

namespace loom::cli {

void print_usage() {
    std::cout << "loom " << VERSION << "\n\n";
    std::cout << "Usage: loom <command> [root] [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  build     Build the module graph and print a summary\n";
    std::cout << "  graph     Print the module graph (sorted nodes and edges)\n\n";
    std::cout << "Options:\n";
    std::cout << "  --json                 Print the graph as JSON (graph only)\n";
    std::cout << "  --log-level=<level>    trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>    Per-module levels, e.g. build=debug,*=warn\n";
    std::cout << "  --log-file=<path>      Also write log records to a file\n";
    std::cout << "  --log-format=<fmt>     text or json\n";
    std::cout << "  -v, -vv, -vvv          Increase verbosity\n";
    std::cout << "  -q                     Only report errors\n";
    std::cout << "  -h, --help             Show this message\n";
    std::cout << "  -V, --version          Show the version\n";
}

void print_version() {
    std::cout << "loom " << VERSION << "\n";
}

void report_error(const BuildError& error) {
    std::cerr << "error: " << error.to_string() << "\n";
}

} // namespace loom::cli
