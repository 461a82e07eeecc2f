//! # Build and Graph Commands
//!
//! | Command             | Output                                         |
//! |---------------------|------------------------------------------------|
//! | `loom build [root]` | module/edge counts and timings                 |
//! | `loom graph [root]` | sorted node listing, then sorted edge listing  |
//! | `... --json`        | nodes and edges as a JSON document             |

#pragma once

#include <string>

namespace loom::cli {

int run_build(const std::string& root);
int run_graph(const std::string& root, bool as_json);

} // namespace loom::cli
