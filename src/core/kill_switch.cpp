#include "kill_switch.hpp"
#include <type_traits>
#include <variant>
#include "../utils/logger.hpp"

namespace arbgate {

KillSwitch::KillSwitch(const KillSwitchConfig& config, ShutdownCallback callback)
    : config_(config), callback_(std::move(callback)) {
}

void KillSwitch::push_event(const Event& event) {
    std::visit([this](auto&& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, SafetyLimitEvent>) {
            const int count = ++safety_events_;
            ARBGATE_LOG_WARN("Kill switch saw safety limit {} ({} of {}): {}",
                             to_string(arg.limit), count, config_.max_safety_events, arg.message);
            if (!config_.enabled) {
                return;
            }
            if (arg.limit == SafetyLimit::DAILY_LOSS && config_.trigger_on_daily_loss) {
                trigger(arg.message);
            } else if (config_.max_safety_events > 0 && count >= config_.max_safety_events) {
                trigger(std::to_string(count) + " safety limit events, last: " + arg.message);
            }
        }
    }, event);
}

void KillSwitch::trigger(const std::string& reason) {
    if (triggered_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reason_ = reason;
    }

    ARBGATE_LOG_CRITICAL("KILL SWITCH ACTIVATED: {}", reason);
    if (callback_) {
        try {
            callback_(reason);
        } catch (const std::exception& e) {
            ARBGATE_LOG_CRITICAL("Kill switch shutdown callback failed: {}", e.what());
        }
    }
}

void KillSwitch::reset() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reason_.clear();
    }
    safety_events_ = 0;
    triggered_ = false;
    ARBGATE_LOG_INFO("Kill switch reset");
}

std::string KillSwitch::reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

} // namespace arbgate
