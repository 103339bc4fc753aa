#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <ostream>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "console_sink.h"
#include "decoders.h"
#include "errors.h"
#include "session.h"
#include "webhook_queue.h"
#include "webhook_worker.h"

constexpr std::chrono::milliseconds INTERRUPT_POLL{100};

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Resolving:    return "resolving";
        case SessionState::Connected:    return "connected";
        case SessionState::Listening:    return "listening";
        case SessionState::Draining:     return "draining";
        case SessionState::Disconnected: return "disconnected";
    }
    return "unknown";
}

static std::string join_names(const std::vector<Characteristic>& list) {
    std::string out;
    for (auto c : list) {
        if (!out.empty()) out += ", ";
        out += characteristic_name(c);
    }
    return out;
}

static Payload u16_le(std::uint16_t v) {
    return Payload{static_cast<std::uint8_t>(v & 0xFFu), static_cast<std::uint8_t>(v >> 8)};
}

static Payload text_bytes(const std::string& text) {
    return Payload(text.begin(), text.end());
}

SessionController::SessionController(const LoggerOptions& opts, std::ostream& out,
                                     HttpPoster* poster, SessionHooks hooks)
    : opts_(opts), out_(out), poster_(poster), hooks_(std::move(hooks)) {}

void SessionController::enter(SessionState next) {
    spdlog::debug("Session {} -> {}", session_state_name(state_), session_state_name(next));
    state_ = next;
}

SessionResult SessionController::run(const DeviceConnector& connect, StopSignal& stop) {
    SessionResult result;

    enter(SessionState::Resolving);
    std::unique_ptr<NotificationSource> source = connect();
    if (!source) throw DeviceNotFoundError("No micro:bit resolved");

    enter(SessionState::Connected);
    spdlog::info("Connected to {}", source->description());
    source->set_on_disconnected([&stop] {
        if (stop.trigger(StopReason::Disconnected)) spdlog::info("micro:bit disconnected");
    });

    std::unique_ptr<WebhookQueue> queue;
    std::unique_ptr<WebhookDispatcher> dispatcher;
    std::unique_ptr<WebhookWorker> worker;
    if (opts_.webhook && poster_) {
        const WebhookConfig& hook = *opts_.webhook;
        queue = std::make_unique<WebhookQueue>();
        dispatcher = std::make_unique<WebhookDispatcher>(hook, *queue);
        worker = std::make_unique<WebhookWorker>(*queue, *poster_, parse_http_url(hook.url),
                                                 hook.timeout);
        worker->start();
        spdlog::info("Forwarding {} to {} ({} mode)", join_names(hook.targets), hook.url,
                     webhook_mode_name(hook.mode));
    }

    ConsoleSink console(out_);
    UpdateAggregator aggregator(console, dispatcher.get(), hooks_.clock);
    AggregatorTask task(aggregator, hooks_.flush_period);
    task.start();

    if (!stop_requested(stop)) apply_sensor_periods(*source);

    enter(SessionState::Listening);
    for (auto c : opts_.characteristics) {
        if (stop_requested(stop)) break;
        try {
            source->subscribe(c, [&task, c](const Payload& data) {
                task.post(c, decode(c, data));
            });
            result.active.push_back(c);
            spdlog::info("Subscribed to {} ({})", characteristic_name(c),
                         characteristic_info(c).characteristic_uuid);
        } catch (const std::exception& e) {
            result.skipped.push_back(c);
            spdlog::debug("Unable to subscribe to {} ({}): {}", characteristic_name(c),
                          characteristic_info(c).characteristic_uuid, e.what());
        }
    }

    if (!result.active.empty()) {
        if (!result.skipped.empty()) {
            spdlog::warn("Skipped characteristics (service not started on micro:bit?): {}",
                         join_names(result.skipped));
        }
        if (!stop_requested(stop)) send_startup_writes(*source);
        spdlog::info("Listening on {} for {:.1f} seconds...", join_names(result.active),
                     std::chrono::duration<double>(opts_.duration).count());
        result.stop_reason = wait_for_stop(stop);
    } else if (stop_requested(stop)) {
        result.stop_reason = stop.reason();
    }
    const bool interrupted = result.stop_reason == StopReason::Interrupted;

    enter(SessionState::Draining);
    ++drains_;
    for (auto c : result.active) {
        try {
            source->unsubscribe(c);
        } catch (const std::exception& e) {
            spdlog::debug("Unsubscribe from {} failed: {}", characteristic_name(c), e.what());
        }
    }
    // Every notification accepted before this point is recorded before the final flush
    task.stop();
    result.snapshots = aggregator.snapshots_emitted();
    if (worker) {
        const int interrupts_before = interrupt_count();
        if (interrupted && queue->size() > 0) {
            spdlog::info("Sending {} pending webhook event(s), press Ctrl-C again to drop them",
                         queue->size());
        }
        worker->drain_and_stop([this, interrupts_before] {
            return interrupt_count() > interrupts_before;
        });
        result.webhook_delivered = worker->delivered();
        result.webhook_failed = worker->failed();
        result.webhook_dropped = worker->dropped();
    }

    try {
        source->disconnect();
    } catch (const std::exception& e) {
        spdlog::debug("Disconnect failed: {}", e.what());
    }
    enter(SessionState::Disconnected);

    if (result.active.empty() && !interrupted) {
        throw SubscriptionError(
            "Failed to subscribe to any characteristics. Ensure the micro:bit "
            "program enables the corresponding BLE services.");
    }
    return result;
}

StopReason SessionController::wait_for_stop(StopSignal& stop) {
    using std::chrono::steady_clock;
    const auto deadline = steady_clock::now() + opts_.duration;
    while (!stop.triggered()) {
        const auto now = steady_clock::now();
        if (now >= deadline) {
            stop.trigger(StopReason::DurationElapsed);
            break;
        }
        if (stop.wait_until(std::min(deadline, now + INTERRUPT_POLL))) break;
        if (interrupt_count() > 0) stop.trigger(StopReason::Interrupted);
    }

    const StopReason reason = *stop.reason();
    switch (reason) {
        case StopReason::DurationElapsed:
            spdlog::info("Time limit reached, stopping notifications.");
            break;
        case StopReason::Disconnected:
            spdlog::info("Disconnected before duration elapsed.");
            break;
        case StopReason::Interrupted:
            spdlog::info("Interrupted by user");
            break;
    }
    return reason;
}

int SessionController::interrupt_count() const {
    return hooks_.interrupts ? hooks_.interrupts() : 0;
}

// Folds a pending Ctrl-C into the stop signal; true once anything stopped the session.
bool SessionController::stop_requested(StopSignal& stop) const {
    if (interrupt_count() > 0) stop.trigger(StopReason::Interrupted);
    return stop.triggered();
}

void SessionController::apply_sensor_periods(NotificationSource& source) {
    struct PeriodTarget {
        const std::optional<std::uint16_t>& ms;
        const char* label;
        const char* service;
        const char* characteristic;
    };
    const PeriodTarget targets[] = {
        {opts_.periods.accelerometer_ms, "accelerometer", ACCELEROMETER_SERVICE_UUID, ACCELEROMETER_PERIOD_UUID},
        {opts_.periods.magnetometer_ms, "magnetometer", MAGNETOMETER_SERVICE_UUID, MAGNETOMETER_PERIOD_UUID},
        {opts_.periods.temperature_ms, "temperature", TEMPERATURE_SERVICE_UUID, TEMPERATURE_PERIOD_UUID},
    };
    for (const auto& t : targets) {
        if (!t.ms) continue;
        try {
            source.write(t.service, t.characteristic, u16_le(*t.ms));
            spdlog::info("Set {} period to {} ms", t.label, *t.ms);
        } catch (const std::exception& e) {
            spdlog::warn("Could not set {} period: {}", t.label, e.what());
        }
    }
}

void SessionController::send_startup_writes(NotificationSource& source) {
    if (opts_.uart_send) {
        try {
            source.write(UART_SERVICE_UUID, UART_RX_UUID, text_bytes(*opts_.uart_send + "\n"));
            spdlog::info("Sent over UART: {}", *opts_.uart_send);
        } catch (const std::exception& e) {
            spdlog::warn("UART send failed: {}", e.what());
        }
    }
    if (opts_.led_text) {
        try {
            source.write(LED_SERVICE_UUID, LED_TEXT_UUID, text_bytes(*opts_.led_text));
            spdlog::info("Sent LED text: {}", *opts_.led_text);
        } catch (const std::exception& e) {
            spdlog::warn("LED text write failed: {}", e.what());
        }
    }
}
