#ifndef LOOM_BUILD_TASK_HPP
#define LOOM_BUILD_TASK_HPP

#include <string>

namespace loom::build {

/// One scheduled pipeline execution.
struct Task {
    /// Normalized absolute path; also the module id.
    std::string path;
    bool is_entry = false;
};

} // namespace loom::build

#endif // LOOM_BUILD_TASK_HPP
