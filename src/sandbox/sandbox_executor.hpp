#pragma once

#include <string>

#include "exercise/exercise_types.hpp"

namespace gradebox::sandbox {

struct SandboxLimits {
    int timeout_ms = 2000;
    long long max_output_bytes = 1024 * 1024;
    long long max_code_bytes = 100 * 1024;
    int memory_limit_mb = 256;
    int max_processes = 64;
};

struct ExecRequest {
    std::string interpreter = "python3";
    // Parent of the per-run scratch directories; system temp dir when empty.
    std::string scratch_root;
    std::string source;
    exercise::Dataset dataset;
    SandboxLimits limits;
};

struct ExecResult {
    int exit_code = -1;
    bool timed_out = false;
    bool output_exceeded = false;
    // Refused before spawning (oversized source, bad dataset, no interpreter).
    bool rejected = false;
    std::string stdout_text;
    std::string stderr_text;
    long long wall_time_ms = 0;
};

class SandboxExecutor {
public:
    static ExecResult Run(const ExecRequest& request);
};

std::string TimeoutMessage(int timeout_ms);

// Whether child programs can be cut off from the network on this host: a new
// network namespace as root, a new user plus network namespace otherwise.
// Checked once per process.
bool NetworkIsolationAvailable();

}  // namespace gradebox::sandbox
