//! # loom Entry Point
//!
//! ```bash
//! loom build [root]             # Build the module graph and print a summary
//! loom graph [root] [--json]    # Print the sorted node and edge listings
//! ```
//!
//! All work happens in the CLI driver (`cli/driver.hpp`).

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return loom_main(argc, argv);
}
