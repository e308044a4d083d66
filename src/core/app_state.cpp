#include "app_state.hpp"
#include <algorithm>
#include <thread>

namespace arbgate {

namespace {

constexpr std::chrono::milliseconds kPollInterval(100);

} // namespace

void AppState::shutdown(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reason_.empty()) {
            reason_ = reason;
        }
    }
    running_ = false;
}

std::string AppState::shutdown_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

bool AppState::wait_for(std::chrono::milliseconds timeout) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (running_) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kPollInterval, deadline - now));
    }
    return running_;
}

} // namespace arbgate
