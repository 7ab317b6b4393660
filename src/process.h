#pragma once

#include <string>
#include <vector>

namespace boxrun {

// Result of a finished child process
struct ProcessResult {
    int exit_code = -1;          // Exit status, or -signal if killed
    std::string output;          // stdout (and stderr when merged)
    std::string error;           // stderr when not merged
};

class Process {
public:
    // Spawn argv[0] from PATH, capture its output and wait for it to exit.
    // With merge_stderr both streams land in `output` in arrival order.
    // Throws std::runtime_error if the process cannot be spawned.
    static ProcessResult run(const std::vector<std::string>& argv, bool merge_stderr = false);
};

} // namespace boxrun
