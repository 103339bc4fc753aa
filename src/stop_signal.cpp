#include <chrono>
#include <mutex>
#include <optional>

#include "stop_signal.h"

const char* stop_reason_name(StopReason reason) {
    switch (reason) {
        case StopReason::DurationElapsed: return "duration elapsed";
        case StopReason::Disconnected:    return "device disconnected";
        case StopReason::Interrupted:     return "interrupted";
    }
    return "unknown";
}

bool StopSignal::trigger(StopReason reason) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (reason_) return false;
        reason_ = reason;
    }
    cv_.notify_all();
    return true;
}

std::optional<StopReason> StopSignal::reason() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return reason_;
}

std::optional<StopReason> StopSignal::wait_until(std::chrono::steady_clock::time_point deadline) const {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait_until(lk, deadline, [this] { return reason_.has_value(); });
    return reason_;
}
