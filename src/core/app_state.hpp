#pragma once

#include <atomic>

namespace arbguard {

// Process-wide run flag, flipped by the signal handler
class AppState {
public:
    AppState() : running_(true) {}

    void shutdown() { running_ = false; }
    bool is_running() const { return running_; }

private:
    std::atomic<bool> running_;
};

} // namespace arbguard
