#pragma once

// ============================================================
// subprocess.hpp -- fork/exec runner with captured output
// ============================================================

#include "platform.hpp"
#include "cancel.hpp"
#include <string>
#include <vector>

namespace subprocess {

struct Result {
    int  exit_code{-1};     // valid when !signalled
    int  signal{0};         // terminating signal, 0 if exited normally
    bool cancelled{false};  // we killed it because the run was cancelled
    std::string output;     // combined stdout+stderr (tail, capped)
};

// Keep at most this much child output
static constexpr size_t MAX_CAPTURED_OUTPUT = 64 * 1024;

// Run argv (argv[0] looked up on PATH) and wait for it.
// Throws std::runtime_error if the child cannot be started.
// If cancel fires, the child gets SIGTERM, then SIGKILL after a grace period.
Result run(const std::vector<std::string>& argv, const CancelToken* cancel = nullptr);

// Human-readable one-line description of how the child ended
std::string describe(const Result& r);

} // namespace subprocess
