#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

enum class StopReason {
    DurationElapsed,
    Disconnected,
    Interrupted,
};

const char* stop_reason_name(StopReason reason);

// Once-only stop request shared by the duration timer, the disconnect
// observer and the interrupt handler. The first trigger wins; later ones
// return false and leave the recorded reason untouched.
class StopSignal {
public:
    bool trigger(StopReason reason);

    std::optional<StopReason> reason() const;
    bool triggered() const { return reason().has_value(); }

    // Waits until triggered or the deadline passes. Returns the reason if
    // triggered, std::nullopt on timeout.
    std::optional<StopReason> wait_until(std::chrono::steady_clock::time_point deadline) const;

private:
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    std::optional<StopReason> reason_;
};
