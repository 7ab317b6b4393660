#include "execution_monitor.h"
#include "errors.h"
#include <algorithm>
#include <exception>
#include <future>
#include <iostream>
#include <thread>

namespace boxrun {

// ProgressTracker

ProgressTracker::ProgressTracker(int total) : total_(std::max(1, total)) {}

int ProgressTracker::start() {
    current_ = std::max(current_, total_ / 10);
    return current_;
}

int ProgressTracker::tick() {
    if (finished_) {
        return current_;
    }

    int next;
    if (polls_ == 0) {
        next = total_ / 5;
    } else if (current_ >= 9 * total_ / 10) {
        next = current_ + 1;
    } else {
        next = current_ + std::max(1, total_ / 20);
    }
    ++polls_;

    next = std::min(next, total_ - 1);
    current_ = std::max(current_, next);
    return current_;
}

int ProgressTracker::finish() {
    finished_ = true;
    current_ = total_;
    return current_;
}

// ExecutionMonitor

ExecutionMonitor::ExecutionMonitor(std::chrono::milliseconds poll_interval, int total)
    : poll_interval_(poll_interval), total_(total) {}

void ExecutionMonitor::notify(ProgressObserver* observer, const ProgressUpdate& update) {
    if (!observer) {
        return;
    }
    try {
        if (!observer->on_progress(update)) {
            std::cerr << "[Monitor] Warning: progress update " << update.progress
                      << "/" << update.total << " was not delivered" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Monitor] Warning: progress observer failed: " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "[Monitor] Warning: progress observer failed with a non-standard exception" << std::endl;
    }
}

void ExecutionMonitor::observe(
    const std::function<void()>& work,
    ProgressObserver* observer,
    const std::string& token
) {
    std::promise<void> done;
    std::future<void> outcome = done.get_future();

    std::thread worker([&work, &done]() {
        try {
            work();
            done.set_value();
        } catch (...) {
            // Handed to the coordinator through the future
            done.set_exception(std::current_exception());
        }
    });

    ProgressTracker tracker(total_);
    int last = -1;
    auto emit = [&](int value) {
        if (value <= last) {
            return;
        }
        last = value;
        notify(observer, {value, tracker.total(), token});
    };

    emit(tracker.start());
    while (outcome.wait_for(poll_interval_) != std::future_status::ready) {
        emit(tracker.tick());
    }
    worker.join();

    emit(tracker.finish());
    outcome.get();
}

Termination ExecutionMonitor::await_termination(ContainerBackend& backend, const std::string& execution_id) {
    Termination termination;
    try {
        termination.exit_code = backend.wait(execution_id).exit_code;
    } catch (const BackendError& e) {
        throw SandboxError(ErrorKind::EXECUTION_WAIT_FAILED,
                           "error waiting for " + execution_id + ": " + e.what());
    }

    try {
        termination.logs = backend.logs(execution_id);
    } catch (const BackendError& e) {
        throw SandboxError(ErrorKind::EXECUTION_WAIT_FAILED,
                           "failed to get logs of " + execution_id + ": " + e.what());
    }

    std::cerr << "[Monitor] " << execution_id << " exited with code " << termination.exit_code << std::endl;
    return termination;
}

} // namespace boxrun
