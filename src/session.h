#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <vector>

#include "http_client.h"
#include "notification_source.h"
#include "options.h"
#include "stop_signal.h"
#include "update_aggregator.h"

enum class SessionState {
    Resolving,
    Connected,
    Listening,
    Draining,
    Disconnected,
};

const char* session_state_name(SessionState state);

struct SessionResult {
    std::optional<StopReason> stop_reason;
    std::vector<Characteristic> active;
    std::vector<Characteristic> skipped;
    std::size_t snapshots = 0;
    std::size_t webhook_delivered = 0;
    std::size_t webhook_failed = 0;
    std::size_t webhook_dropped = 0;
};

// Resolves and connects; throws DeviceNotFoundError when nothing matches.
using DeviceConnector = std::function<std::unique_ptr<NotificationSource>()>;

struct SessionHooks {
    WallClock clock = system_wall_clock();
    std::chrono::milliseconds flush_period = FLUSH_PERIOD;
    // Ctrl-C presses so far. The first stops the session as Interrupted, even
    // before listening starts; one more during the drain abandons queued
    // webhook events.
    std::function<int()> interrupts;
};

// Drives Resolving -> Connected -> Listening -> Draining -> Disconnected.
// Every stop cause goes through the same drain: unsubscribe all, final
// flush, drain the webhook queue, stop the worker, release the connection.
class SessionController {
public:
    SessionController(const LoggerOptions& opts, std::ostream& out, HttpPoster* poster,
                      SessionHooks hooks = {});

    // Throws DeviceNotFoundError, or SubscriptionError when no characteristic
    // could be subscribed and nobody interrupted first. The stop signal may be
    // triggered from other threads.
    SessionResult run(const DeviceConnector& connect, StopSignal& stop);

    SessionState state() const { return state_; }
    std::size_t drain_count() const { return drains_; }

private:
    void enter(SessionState next);
    void apply_sensor_periods(NotificationSource& source);
    void send_startup_writes(NotificationSource& source);
    StopReason wait_for_stop(StopSignal& stop);
    int interrupt_count() const;
    bool stop_requested(StopSignal& stop) const;

    const LoggerOptions& opts_;
    std::ostream& out_;
    HttpPoster* poster_;
    SessionHooks hooks_;
    SessionState state_ = SessionState::Resolving;
    std::size_t drains_ = 0;
};
