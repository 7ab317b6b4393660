#pragma once

#include <string>
#include <chrono>
#include <functional>
#include "container_backend.h"

namespace boxrun {

struct ProgressUpdate {
    int progress = 0;
    int total = 0;
    std::string token;           // Caller-supplied correlation token, echoed back
};

// Receives progress for one request. Returning false (or throwing) is
// logged and otherwise ignored.
class ProgressObserver {
public:
    virtual ~ProgressObserver() = default;
    virtual bool on_progress(const ProgressUpdate& update) = 0;
};

// Synthetic progress curve; values never decrease and stay below total
// until finish()
class ProgressTracker {
public:
    explicit ProgressTracker(int total);

    int start();                 // Launch value: total/10
    int tick();                  // One poll elapsed
    int finish();                // Terminal value: total

    int current() const { return current_; }
    int total() const { return total_; }
    bool finished() const { return finished_; }

private:
    int total_;
    int current_ = 0;
    int polls_ = 0;
    bool finished_ = false;
};

// Exit status and combined output of a terminated execution
struct Termination {
    int exit_code = -1;
    std::string logs;
};

class ExecutionMonitor {
public:
    ExecutionMonitor(std::chrono::milliseconds poll_interval, int total);

    // Run work on its own thread and report progress until it completes.
    // Rethrows whatever work threw; the terminal update is sent either way.
    void observe(const std::function<void()>& work, ProgressObserver* observer, const std::string& token);

    // Block until the execution stops, then fetch its logs.
    // Throws SandboxError(EXECUTION_WAIT_FAILED)
    static Termination await_termination(ContainerBackend& backend, const std::string& execution_id);

private:
    void notify(ProgressObserver* observer, const ProgressUpdate& update);

    std::chrono::milliseconds poll_interval_;
    int total_;
};

} // namespace boxrun
