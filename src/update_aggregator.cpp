#include <chrono>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "update_aggregator.h"

WallClock system_wall_clock() {
    return [] { return std::chrono::system_clock::now(); };
}

UpdateAggregator::UpdateAggregator(ConsoleSink& console, WebhookDispatcher* webhook,
                                   WallClock clock)
    : console_(console), webhook_(webhook), clock_(std::move(clock)) {}

void UpdateAggregator::record_update(Characteristic c, std::string decoded) {
    if (finished_) return;
    if (webhook_) webhook_->on_update(c, decoded, clock_());
    table_.record(c, std::move(decoded));
}

bool UpdateAggregator::flush_tick() {
    if (finished_) return false;
    return emit_pending();
}

bool UpdateAggregator::final_flush() {
    if (finished_) return false;
    finished_ = true;
    const bool emitted = emit_pending();
    spdlog::debug("Final flush {}", emitted ? "emitted pending updates" : "had nothing pending");
    return emitted;
}

bool UpdateAggregator::emit_pending() {
    if (table_.empty()) return false;
    const Snapshot snapshot = table_.take(clock_());
    console_.emit(snapshot);
    if (webhook_) webhook_->on_snapshot(snapshot);
    ++emitted_;
    return true;
}

AggregatorTask::AggregatorTask(UpdateAggregator& aggregator, std::chrono::milliseconds period)
    : aggregator_(aggregator), period_(period) {}

AggregatorTask::~AggregatorTask() {
    if (thread_.joinable()) {
        inbox_.close();
        thread_.join();
    }
}

void AggregatorTask::start() {
    thread_ = std::thread([this] { run(); });
}

void AggregatorTask::post(Characteristic c, std::string decoded) {
    if (!inbox_.push(Notification{c, std::move(decoded)})) {
        spdlog::debug("Dropped late {} update after shutdown", characteristic_name(c));
    }
}

void AggregatorTask::stop() {
    inbox_.close();
    if (thread_.joinable()) {
        thread_.join();
    } else {
        // Never started: drain the closed inbox on the caller's thread
        run();
    }
}

void AggregatorTask::run() {
    auto next_tick = std::chrono::steady_clock::now() + period_;
    Notification n;
    while (true) {
        switch (inbox_.pop_until(n, next_tick)) {
            case PopStatus::Item:
                aggregator_.record_update(n.characteristic, std::move(n.decoded));
                break;
            case PopStatus::Timeout:
                aggregator_.flush_tick();
                next_tick += period_;
                break;
            case PopStatus::Closed:
                aggregator_.final_flush();
                return;
        }
    }
}
