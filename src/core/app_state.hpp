#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

namespace arbgate {

// Process-wide run flag of the arbgate binary. shutdown() only touches an
// atomic and may be called from a signal handler.
class AppState {
public:
    AppState() : running_(true) {}

    void shutdown() { running_ = false; }
    void shutdown(const std::string& reason);
    bool is_running() const { return running_; }

    std::string shutdown_reason() const;

    // Sleeps until the timeout elapses or shutdown is requested. Returns
    // is_running().
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    std::atomic<bool> running_;
    mutable std::mutex mutex_;
    std::string reason_;
};

} // namespace arbgate
