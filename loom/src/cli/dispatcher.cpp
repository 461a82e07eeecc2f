//! # CLI Command Dispatcher
//!
//! ```text
//! loom_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ build          → run_build()
//!   └─ graph          → run_graph()
//! ```
//!
//! Logging options (`--log-level=`, `--log-filter=`, `--log-file=`,
//! `--log-format=`, `-v`, `-q`) are accepted by every command and consumed
//! before the command sees its arguments.

#include "commands/cmd_build.hpp"
#include "driver.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace loom::cli {

/// ## Return Codes
///
/// | Code | Meaning                          |
/// |------|----------------------------------|
/// | 0    | Success                          |
/// | 1    | Build error or bad usage         |
int loom_main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 0;
    }

    log::Logger::init(log::parse_log_options(argc, argv));

    std::string command = argv[1];

    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    std::vector<std::string> positional;
    bool as_json = false;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (log::is_log_option(arg))
            continue;
        if (arg == "--json") {
            as_json = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() > 1) {
        std::cerr << "Usage: loom " << command << " [root]\n";
        return 1;
    }
    std::string root = positional.empty() ? "." : positional[0];

    LOOM_LOG_DEBUG("cli", command << " " << root);

    if (command == "build")
        return run_build(root);

    if (command == "graph")
        return run_graph(root, as_json);

    std::cerr << "Error: Unknown command '" << command << "'\n";
    std::cerr << "Run 'loom --help' for usage information.\n";
    return 1;
}

} // namespace loom::cli

int loom_main(int argc, char* argv[]) {
    return loom::cli::loom_main(argc, argv);
}
