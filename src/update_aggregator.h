#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <thread>

#include "channel.h"
#include "characteristics.h"
#include "console_sink.h"
#include "snapshot.h"
#include "webhook.h"

constexpr std::chrono::milliseconds FLUSH_PERIOD{1000};

using WallClock = std::function<WallTime()>;

WallClock system_wall_clock();

// Latest-value table plus the emission rules. Not thread-safe: owned by the
// aggregator task, which is the only caller.
class UpdateAggregator {
public:
    UpdateAggregator(ConsoleSink& console, WebhookDispatcher* webhook, WallClock clock);

    void record_update(Characteristic c, std::string decoded);

    // Snapshot and clear; emits only when something was recorded.
    // Returns true when a snapshot was emitted.
    bool flush_tick();

    // Last flush before shutdown. Runs at most once; later calls do nothing.
    bool final_flush();

    std::size_t pending() const { return table_.size(); }
    // Readable from other threads while the task runs
    std::size_t snapshots_emitted() const { return emitted_.load(); }
    bool finished() const { return finished_; }

private:
    bool emit_pending();

    ConsoleSink& console_;
    WebhookDispatcher* webhook_;
    WallClock clock_;
    LatestValueTable table_;
    std::atomic<std::size_t> emitted_{0};
    bool finished_ = false;
};

struct Notification {
    Characteristic characteristic = Characteristic::UartTx;
    std::string decoded;
};

// Runs an UpdateAggregator on its own thread. Notification callbacks post()
// into the inbox; the thread waits on the inbox or the next tick deadline,
// whichever comes first. stop() closes the inbox: everything posted before it
// is recorded, then the final flush runs and the thread exits.
class AggregatorTask {
public:
    AggregatorTask(UpdateAggregator& aggregator,
                   std::chrono::milliseconds period = FLUSH_PERIOD);
    ~AggregatorTask();

    AggregatorTask(const AggregatorTask&) = delete;
    AggregatorTask& operator=(const AggregatorTask&) = delete;

    void start();
    // Safe to call from any thread, including notification callbacks.
    void post(Characteristic c, std::string decoded);
    // Blocks until the final flush has completed.
    void stop();

private:
    void run();

    UpdateAggregator& aggregator_;
    std::chrono::milliseconds period_;
    Channel<Notification> inbox_;
    std::thread thread_;
};
